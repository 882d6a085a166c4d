// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_tree.hpp"
#include "errors.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <type_traits>

namespace forksim {
namespace chain {

BlockTree::BlockTree() {
  auto iter = m_block_index.try_emplace(m_next_id, m_next_id, nullptr, GENESIS_MINER_ID,
                                        MinerGroup::HONEST, true).first;
  const Block &genesis = iter->second;
  ++m_next_id;

  m_children.emplace_back();
  m_tips.AddTip(&genesis);
  m_active_chain.SetTip(genesis);

  LOG_CHAIN_TRACE("BlockTree initialized with genesis id={}", genesis.id);
}

BlockTree::~BlockTree() = default;

const Block &BlockTree::AddBlock(BlockId parent_id, MinerGroup group,
                                 const std::string &miner_id) {
  const Block *pparent = LookupBlock(parent_id);
  if (!pparent) {
    LOG_CHAIN_ERROR("AddBlock: parent {} not found (miner={}, blocks={})",
                    parent_id, miner_id, m_block_index.size());
    throw InvalidParent(parent_id);
  }

  const Block &old_tip = CanonicalTip();
  const bool becomes_tip = pparent->nHeight + 1 > old_tip.nHeight;

  // Construct in place (Block is neither copyable nor movable)
  static_assert(std::is_same<decltype(m_block_index), std::map<BlockId, Block>>::value,
                "m_block_index must be node-based: pprev and tip pointers "
                "refer to its elements");
  const BlockId id = m_next_id;
  auto iter =
      m_block_index.try_emplace(id, id, pparent, miner_id, group, becomes_tip).first;
  const Block &block = iter->second;
  ++m_next_id;

  m_children[parent_id].push_back(id);
  m_children.emplace_back();
  m_tips.AddTip(&block);

  LOG_CHAIN_TRACE("AddBlock: {}", block.ToString());

  if (becomes_tip) {
    if (block.pprev != &old_tip) {
      // Active chain still ends at old_tip here
      const Block *fork = m_active_chain.FindFork(&block);
      const int depth = old_tip.nHeight - (fork ? fork->nHeight : 0);
      ++m_reorg_count;
      m_max_reorg_depth = std::max(m_max_reorg_depth, depth);
      LOG_CHAIN_DEBUG("Reorg: canonical tip {} (height {}) -> {} (height {}), "
                      "fork point height {}, {} block(s) disconnected",
                      old_tip.id, old_tip.nHeight, block.id, block.nHeight,
                      fork ? fork->nHeight : 0, depth);
    }
    m_active_chain.SetTip(block);
  }

  return block;
}

std::vector<const Block *> BlockTree::Tips() const {
  std::vector<const Block *> tips = m_tips.GetTips();
  std::sort(tips.begin(), tips.end(),
            [](const Block *a, const Block *b) { return a->id < b->id; });
  return tips;
}

int BlockTree::HeightOf(BlockId id) const {
  const Block *pblock = LookupBlock(id);
  if (!pblock) {
    throw UnknownBlock(id);
  }
  return pblock->nHeight;
}

const Block &BlockTree::CanonicalTip() const {
  // The tip set always holds at least genesis
  return *m_tips.FindBestTip();
}

const Block &BlockTree::Genesis() const { return m_block_index.begin()->second; }

const Block *BlockTree::LookupBlock(BlockId id) const {
  auto it = m_block_index.find(id);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

const std::vector<BlockId> &BlockTree::Children(BlockId id) const {
  if (id >= m_children.size()) {
    throw UnknownBlock(id);
  }
  return m_children[id];
}

} // namespace chain
} // namespace forksim
