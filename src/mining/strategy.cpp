// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "mining/strategy.hpp"
#include "chain/block_tree.hpp"
#include "errors.hpp"
#include "util/logging.hpp"

namespace forksim {
namespace mining {

chain::BlockId HonestStrategy::SelectParent(const chain::BlockTree &tree) {
  return tree.CanonicalTip().id;
}

ColludingStrategy::ColludingStrategy(int gap) : gap_(gap) {
  if (gap < 0) {
    throw InvalidConfiguration("gap must be >= 0 (got " + std::to_string(gap) + ")");
  }
}

void ColludingStrategy::Adopt(const chain::Block &canonical_tip) {
  fork_tip_ = canonical_tip.id;
  fork_adopted_height_ = canonical_tip.nHeight;
}

chain::BlockId ColludingStrategy::SelectParent(const chain::BlockTree &tree) {
  const chain::Block &tip = tree.CanonicalTip();

  if (fork_tip_ == chain::NULL_BLOCK_ID) {
    Adopt(tip);
    LOG_SIM_TRACE("Colluding: adopted canonical tip {} (height {}) as first fork",
                  tip.id, tip.nHeight);
    return fork_tip_;
  }

  // Height lookup throws UnknownBlock if the pointer came from another tree
  const int64_t fork_height = tree.HeightOf(fork_tip_);

  // 64-bit sum: a gap near INT_MAX must behave as "never abandon"
  if (fork_height + static_cast<int64_t>(gap_) >= static_cast<int64_t>(tip.nHeight)) {
    return fork_tip_;
  }

  // A pointer still on the canonical path is simply behind, not abandoned
  if (!tree.ActiveChain().Contains(tree.LookupBlock(fork_tip_))) {
    ++abandon_count_;
    LOG_SIM_DEBUG("Colluding: abandoning fork at {} (height {}), public tip {} at "
                  "height {} exceeds gap {}",
                  fork_tip_, fork_height, tip.id, tip.nHeight, gap_);
  }
  Adopt(tip);
  return fork_tip_;
}

void ColludingStrategy::OnBlockMined(const chain::Block &block) {
  fork_tip_ = block.id;
}

} // namespace mining
} // namespace forksim
