// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain.hpp"
#include "chain/chain_selector.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace forksim {
namespace chain {

// BlockTree - Append-only tree of every mined block
//
// Owns all Block objects (id -> Block map), the tip set (ChainSelector) and
// the canonical path (CChain from genesis to the canonical tip). Genesis is
// created by the constructor; each AddBlock() appends exactly one leaf and
// never modifies an existing block.
//
// THREAD SAFETY: NO internal synchronization. The simulation is
// single-threaded; RoundSimulator is the only writer.
class BlockTree {
public:
  BlockTree();
  ~BlockTree();

  BlockTree(const BlockTree &) = delete;
  BlockTree &operator=(const BlockTree &) = delete;

  // Append a block mined by miner_id on top of parent_id.
  // Throws InvalidParent if parent_id is not in the tree.
  const Block &AddBlock(BlockId parent_id, MinerGroup group,
                        const std::string &miner_id);

  // All blocks without children, in creation order (never empty)
  std::vector<const Block *> Tips() const;

  size_t GetTipCount() const { return m_tips.GetTipCount(); }

  // O(1) height lookup. Throws UnknownBlock for ids not in the tree.
  int HeightOf(BlockId id) const;

  // Tip with maximum height, earliest-created on ties
  const Block &CanonicalTip() const;

  const Block &Genesis() const;

  // Look up block by id (returns nullptr if not found)
  const Block *LookupBlock(BlockId id) const;

  // Children of a block in creation order. Throws UnknownBlock.
  const std::vector<BlockId> &Children(BlockId id) const;

  // Total blocks including genesis
  size_t GetBlockCount() const { return m_block_index.size(); }

  // Canonical path genesis -> CanonicalTip()
  const CChain &ActiveChain() const { return m_active_chain; }

  // Read-only access to every block, ordered by id
  const std::map<BlockId, Block> &GetBlockIndex() const { return m_block_index; }

  // Number of times the canonical tip moved to a block that does not extend
  // the previous canonical tip, and the deepest such switch (blocks dropped
  // from the old canonical path)
  int GetReorgCount() const { return m_reorg_count; }
  int GetMaxReorgDepth() const { return m_max_reorg_depth; }

private:
  // Map of all blocks: id -> Block (node-based, addresses stay valid)
  std::map<BlockId, Block> m_block_index;

  // Child lists, indexed by BlockId (ids are dense)
  std::vector<std::vector<BlockId>> m_children;

  ChainSelector m_tips;

  // Canonical path (points to Block objects owned by m_block_index)
  CChain m_active_chain;

  BlockId m_next_id{0};
  int m_reorg_count{0};
  int m_max_reorg_depth{0};
};

} // namespace chain
} // namespace forksim
