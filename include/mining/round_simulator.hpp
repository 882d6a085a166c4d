// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "mining/miner_pool.hpp"
#include "mining/random_source.hpp"

namespace forksim {

namespace chain {
class BlockTree;
} // namespace chain

namespace mining {

// RoundSimulator - Drives the mining rounds
//
// Each round: pick the winning miner, ask its group strategy for a parent,
// append the new block to the tree, count it for the miner. Rounds run
// strictly one after another; the tree has no other writer.
class RoundSimulator {
public:
  RoundSimulator(chain::BlockTree &tree, MinerPool &pool, RandomSource &rng);

  // Execute a single round and return the block it produced
  const chain::Block &RunRound();

  // Execute `rounds` rounds. Throws InvalidConfiguration (before any round
  // runs) if rounds < 0.
  void Run(int rounds);

  int RoundsCompleted() const { return rounds_completed_; }

private:
  chain::BlockTree &tree_;
  MinerPool &pool_;
  RandomSource &rng_;
  int rounds_completed_{0};
};

} // namespace mining
} // namespace forksim
