// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <cstdint>

namespace forksim {

namespace chain {
class BlockTree;
} // namespace chain

namespace mining {

// MiningStrategy - Chooses the block a winning miner builds on
//
// One strategy object serves a whole miner group. SelectParent() only reads
// the tree; RoundSimulator appends the block and then reports it back through
// OnBlockMined() so stateful strategies can follow their own work.
class MiningStrategy {
public:
  virtual ~MiningStrategy() = default;

  virtual chain::BlockId SelectParent(const chain::BlockTree &tree) = 0;

  virtual void OnBlockMined(const chain::Block &/*block*/) {}
};

// Honest miners always extend the current canonical tip
class HonestStrategy : public MiningStrategy {
public:
  chain::BlockId SelectParent(const chain::BlockTree &tree) override;
};

/**
 * ColludingStrategy - Gap-bounded private fork shared by the colluding group
 *
 * The group keeps one fork pointer. On every colluding win:
 * - no pointer yet: adopt the canonical tip
 * - fork height + gap >= canonical tip height: keep building on the fork
 * - otherwise: abandon the fork and adopt the canonical tip
 * The block just mined becomes the new fork pointer.
 *
 * With gap 0 the group mines exactly like honest miners. A gap larger than
 * the number of rounds means the fork is never abandoned.
 */
class ColludingStrategy : public MiningStrategy {
public:
  explicit ColludingStrategy(int gap);

  chain::BlockId SelectParent(const chain::BlockTree &tree) override;
  void OnBlockMined(const chain::Block &block) override;

  int GetGap() const { return gap_; }

  // Current fork pointer (NULL_BLOCK_ID before the first colluding win)
  chain::BlockId GetForkTip() const { return fork_tip_; }

  // Canonical height at the moment the current fork was adopted (-1 if none)
  int GetForkAdoptedHeight() const { return fork_adopted_height_; }

  // Times the group gave up a fork that was off the canonical path because
  // the public chain ran ahead
  int GetAbandonCount() const { return abandon_count_; }

private:
  void Adopt(const chain::Block &canonical_tip);

  int gap_;
  chain::BlockId fork_tip_{chain::NULL_BLOCK_ID};
  int fork_adopted_height_{-1};
  int abandon_count_{0};
};

} // namespace mining
} // namespace forksim
