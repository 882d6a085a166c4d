// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "stats/confirmation_analyzer.hpp"
#include "stats/fork_analyzer.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace forksim {
namespace stats {

// SimulationReport - Everything a finished run exposes to the outer layers
struct SimulationReport {
  // Parameters of the run
  int honest{0};
  int colluding{0};
  int rounds{0};
  int gap{0};
  uint64_t seed{0};

  ForkStats forks;
  ConfirmationStats confirmation;

  // Colluding strategy and canonical tip history
  int colluding_abandon_count{0};
  int reorg_count{0};
  int max_reorg_depth{0};
};

// Human-readable summary ("Fork statistics" / "Miner statistics").
// Verbose adds one line per fork and one line per miner.
std::string FormatReport(const SimulationReport &report, bool verbose);

// Machine-readable form of the same data
nlohmann::json ToJson(const SimulationReport &report);

} // namespace stats
} // namespace forksim
