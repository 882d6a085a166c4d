// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "mining/round_simulator.hpp"
#include "chain/block_tree.hpp"
#include "errors.hpp"
#include "util/logging.hpp"

namespace forksim {
namespace mining {

RoundSimulator::RoundSimulator(chain::BlockTree &tree, MinerPool &pool,
                               RandomSource &rng)
    : tree_(tree), pool_(pool), rng_(rng) {}

const chain::Block &RoundSimulator::RunRound() {
  Miner &miner = pool_.SelectMiner(rng_);
  MiningStrategy &strategy = pool_.StrategyFor(miner.group);

  const chain::BlockId parent_id = strategy.SelectParent(tree_);
  const chain::Block &block = tree_.AddBlock(parent_id, miner.group, miner.id);

  ++miner.blocks_mined;
  strategy.OnBlockMined(block);
  ++rounds_completed_;

  LOG_SIM_TRACE("Round {}: {} mined block {} at height {} on parent {}{}",
                rounds_completed_, miner.id, block.id, block.nHeight, parent_id,
                block.best_at_creation ? " (new canonical tip)" : "");
  return block;
}

void RoundSimulator::Run(int rounds) {
  if (rounds < 0) {
    throw InvalidConfiguration("rounds must be >= 0 (got " + std::to_string(rounds) + ")");
  }

  LOG_SIM_DEBUG("Running {} round(s) with {} miner(s)", rounds, pool_.size());

  // Progress at debug level every 10% for long runs
  const int progress_step = rounds >= 1000 ? rounds / 10 : 0;

  for (int i = 0; i < rounds; ++i) {
    RunRound();
    if (progress_step > 0 && (i + 1) % progress_step == 0) {
      LOG_SIM_DEBUG("Progress: {}/{} rounds, canonical height {}, {} tip(s)", i + 1,
                    rounds, tree_.CanonicalTip().nHeight, tree_.GetTipCount());
    }
  }
}

} // namespace mining
} // namespace forksim
