// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include <sstream>
#include <utility>

namespace forksim {
namespace chain {

std::string MinerGroupToString(MinerGroup group) {
  switch (group) {
  case MinerGroup::HONEST:
    return "honest";
  case MinerGroup::COLLUDING:
    return "colluding";
  }
  return "unknown";
}

Block::Block(BlockId id_in, const Block *parent, std::string miner,
             MinerGroup miner_group, bool best)
    : id(id_in), nHeight(parent ? parent->nHeight + 1 : 0), pprev(parent),
      miner_id(std::move(miner)), group(miner_group), best_at_creation(best) {}

const Block *Block::GetAncestor(int height) const {
  if (height > nHeight || height < 0)
    return nullptr;

  const Block *pwalk = this;
  while (pwalk && pwalk->nHeight > height) {
    pwalk = pwalk->pprev;
  }
  return pwalk;
}

std::string Block::ToString() const {
  std::ostringstream ss;
  ss << "Block(id=" << id << ", height=" << nHeight << ", parent=";
  if (pprev)
    ss << pprev->id;
  else
    ss << "none";
  ss << ", miner=" << miner_id << ", group=" << MinerGroupToString(group)
     << ", best_at_creation=" << (best_at_creation ? "true" : "false") << ")";
  return ss.str();
}

} // namespace chain
} // namespace forksim
