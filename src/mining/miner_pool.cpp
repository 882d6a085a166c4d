// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "mining/miner_pool.hpp"
#include "errors.hpp"
#include "util/logging.hpp"

namespace forksim {
namespace mining {

MinerPool::MinerPool(int honest_count, int colluding_count, int gap)
    : honest_count_(honest_count), colluding_count_(colluding_count) {
  if (honest_count < 0 || colluding_count < 0) {
    throw InvalidConfiguration("miner counts must be >= 0 (honest=" +
                               std::to_string(honest_count) + ", colluding=" +
                               std::to_string(colluding_count) + ")");
  }
  if (honest_count == 0 && colluding_count == 0) {
    throw InvalidConfiguration("at least one miner is required");
  }

  honest_strategy_ = std::make_unique<HonestStrategy>();
  colluding_strategy_ = std::make_unique<ColludingStrategy>(gap);

  // Each count fits in int, their sum may not
  const size_t pool_size =
      static_cast<size_t>(honest_count) + static_cast<size_t>(colluding_count);
  miners_.reserve(pool_size);
  for (int i = 0; i < honest_count; ++i) {
    miners_.push_back(Miner{"H" + std::to_string(i + 1), chain::MinerGroup::HONEST});
  }
  for (int i = 0; i < colluding_count; ++i) {
    miners_.push_back(Miner{"C" + std::to_string(i + 1), chain::MinerGroup::COLLUDING});
  }

  LOG_SIM_DEBUG("MinerPool: {} honest, {} colluding miner(s), gap {}", honest_count,
                colluding_count, gap);
}

Miner &MinerPool::SelectMiner(RandomSource &rng) {
  size_t index = rng.NextIndex(miners_.size());
  if (index >= miners_.size()) {
    // Only a broken RandomSource gets here
    throw std::out_of_range("RandomSource returned index " + std::to_string(index) +
                            " for pool of " + std::to_string(miners_.size()));
  }
  return miners_[index];
}

MiningStrategy &MinerPool::StrategyFor(chain::MinerGroup group) {
  if (group == chain::MinerGroup::COLLUDING) {
    return *colluding_strategy_;
  }
  return *honest_strategy_;
}

} // namespace mining
} // namespace forksim
