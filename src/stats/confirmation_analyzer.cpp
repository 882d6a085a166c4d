// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "stats/confirmation_analyzer.hpp"
#include "chain/block_tree.hpp"
#include "mining/miner_pool.hpp"
#include "util/logging.hpp"
#include <map>

namespace forksim {
namespace stats {

static double Percent(int part, int whole, double if_empty) {
  if (whole == 0) {
    return if_empty;
  }
  return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

ConfirmationStats ConfirmationAnalyzer::Analyze(mining::MinerPool &pool) const {
  ConfirmationStats stats;

  // Walk the canonical path back from the tip (genesis is credited to nobody)
  std::map<std::string, int> included;
  const chain::Block *pwalk = &tree_.CanonicalTip();
  while (pwalk && !pwalk->IsGenesis()) {
    ++included[pwalk->miner_id];
    ++stats.canonical_length;
    pwalk = pwalk->pprev;
  }

  for (mining::Miner &miner : pool.GetMiners()) {
    auto it = included.find(miner.id);
    miner.blocks_included = it != included.end() ? it->second : 0;

    MinerConfirmation mc;
    mc.miner_id = miner.id;
    mc.group = miner.group;
    mc.mined = miner.blocks_mined;
    mc.included = miner.blocks_included;
    mc.rate_pct = Percent(mc.included, mc.mined, 0.0);
    stats.miners.push_back(mc);

    GroupConfirmation &group =
        miner.group == chain::MinerGroup::COLLUDING ? stats.colluding : stats.honest;
    ++group.miners;
    group.mined += mc.mined;
    group.included += mc.included;
  }

  stats.honest.rate_pct = Percent(stats.honest.included, stats.honest.mined, 100.0);
  stats.colluding.rate_pct =
      Percent(stats.colluding.included, stats.colluding.mined, 100.0);

  LOG_STATS_DEBUG("Confirmation: honest {}/{} ({:.2f}%), colluding {}/{} ({:.2f}%)",
                  stats.honest.included, stats.honest.mined, stats.honest.rate_pct,
                  stats.colluding.included, stats.colluding.mined,
                  stats.colluding.rate_pct);
  return stats;
}

} // namespace stats
} // namespace forksim
