// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "mining/random_source.hpp"
#include "mining/strategy.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace forksim {
namespace mining {

// Miner - One participant with equal mining power
struct Miner {
  std::string id;            // "H1".."Hn" (honest), "C1".."Cm" (colluding)
  chain::MinerGroup group;
  int blocks_mined{0};       // incremented by RoundSimulator
  int blocks_included{0};    // finalized by ConfirmationAnalyzer after the run
};

// MinerPool - The miner population and one strategy per group
//
// Miners are stored honest first (H1..Hn), then colluding (C1..Cm). Every
// round exactly one miner wins, chosen uniformly across the whole pool.
class MinerPool {
public:
  // Throws InvalidConfiguration on negative counts/gap or an empty pool
  MinerPool(int honest_count, int colluding_count, int gap);

  MinerPool(const MinerPool &) = delete;
  MinerPool &operator=(const MinerPool &) = delete;

  // Uniformly pick the miner that wins this round
  Miner &SelectMiner(RandomSource &rng);

  MiningStrategy &StrategyFor(chain::MinerGroup group);

  const ColludingStrategy &GetColludingStrategy() const { return *colluding_strategy_; }

  const std::vector<Miner> &GetMiners() const { return miners_; }
  std::vector<Miner> &GetMiners() { return miners_; }

  int GetHonestCount() const { return honest_count_; }
  int GetColludingCount() const { return colluding_count_; }
  size_t size() const { return miners_.size(); }

private:
  int honest_count_;
  int colluding_count_;
  std::vector<Miner> miners_;
  std::unique_ptr<HonestStrategy> honest_strategy_;
  std::unique_ptr<ColludingStrategy> colluding_strategy_;
};

} // namespace mining
} // namespace forksim
