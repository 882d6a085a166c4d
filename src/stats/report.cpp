// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "stats/report.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace forksim {
namespace stats {

namespace {

constexpr const char *SEPARATOR = "--------------------";

// Rounded to two decimals, trailing zeros dropped down to one: 66.67, 12.5, 100.0
std::string Pct(double value) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << std::round(value * 100.0) / 100.0;
  std::string text = ss.str();
  if (text.back() == '0') {
    text.pop_back();
  }
  return text;
}

// Rate of a miner or group; `if_empty` is printed verbatim when nothing was mined
std::string Rate(double value, int mined, const char *if_empty) {
  return mined == 0 ? std::string(if_empty) : Pct(value);
}

} // anonymous namespace

std::string FormatReport(const SimulationReport &report, bool verbose) {
  const ForkStats &forks = report.forks;
  const ConfirmationStats &conf = report.confirmation;

  std::ostringstream out;
  out << "Fork statistics:\n" << SEPARATOR << "\n";
  out << "  Num forks: " << forks.fork_count << "\n";
  if (verbose) {
    for (const ForkInfo &fork : forks.forks) {
      out << "  * From height " << fork.span_from << " to "
          << fork.height + fork.stale_depth << " (" << fork.branch_count
          << " branches, depth " << fork.depth << ")\n";
    }
  }
  out << "  Max depth: " << forks.max_depth << "\n";
  out << "  Max stale depth: " << forks.max_stale_depth << "\n";
  out << "  Abandoned blocks: " << forks.abandoned_blocks << "/" << forks.mined_blocks
      << " (" << Pct(forks.abandoned_pct) << "%)\n";
  out << "  Reorgs: " << report.reorg_count << " (max depth "
      << report.max_reorg_depth << ")\n";
  if (report.colluding > 0) {
    out << "  Colluding forks abandoned: " << report.colluding_abandon_count << "\n";
  }
  out << SEPARATOR << "\n";

  out << "Miner statistics:\n";
  if (verbose) {
    for (const MinerConfirmation &miner : conf.miners) {
      out << "  * " << miner.miner_id << ": " << std::setw(4) << miner.mined
          << " blocks mined, " << std::setw(4) << miner.included
          << " blocks included: " << Rate(miner.rate_pct, miner.mined, "0")
          << "% confirmed\n";
    }
  }
  out << SEPARATOR << "\n";
  out << "  Honest miners:    " << Rate(conf.honest.rate_pct, conf.honest.mined, "100")
      << "% confirmed\n";
  out << "  Colluding miners: "
      << Rate(conf.colluding.rate_pct, conf.colluding.mined, "100") << "% confirmed\n";
  return out.str();
}

nlohmann::json ToJson(const SimulationReport &report) {
  using json = nlohmann::json;

  json j;
  j["config"] = {{"honest", report.honest},
                 {"colluding", report.colluding},
                 {"rounds", report.rounds},
                 {"gap", report.gap},
                 {"seed", report.seed}};

  json forks = json::array();
  for (const ForkInfo &fork : report.forks.forks) {
    forks.push_back({{"fork_point", fork.fork_point},
                     {"height", fork.height},
                     {"branches", fork.branch_count},
                     {"depth", fork.depth},
                     {"span_from", fork.span_from},
                     {"span_to", fork.span_to},
                     {"stale_depth", fork.stale_depth},
                     {"canonical", fork.on_canonical_chain}});
  }
  j["forks"] = {{"count", report.forks.fork_count},
                {"max_depth", report.forks.max_depth},
                {"max_stale_depth", report.forks.max_stale_depth},
                {"mined_blocks", report.forks.mined_blocks},
                {"canonical_length", report.forks.canonical_length},
                {"abandoned_blocks", report.forks.abandoned_blocks},
                {"abandoned_pct", report.forks.abandoned_pct},
                {"reorgs", report.reorg_count},
                {"max_reorg_depth", report.max_reorg_depth},
                {"colluding_abandoned", report.colluding_abandon_count},
                {"points", forks}};

  json miners = json::array();
  for (const MinerConfirmation &miner : report.confirmation.miners) {
    miners.push_back({{"id", miner.miner_id},
                      {"group", chain::MinerGroupToString(miner.group)},
                      {"mined", miner.mined},
                      {"included", miner.included},
                      {"confirmed_pct", miner.rate_pct}});
  }

  auto group_json = [](const GroupConfirmation &g) {
    return json{{"miners", g.miners},
                {"mined", g.mined},
                {"included", g.included},
                {"confirmed_pct", g.rate_pct}};
  };
  j["confirmation"] = {{"canonical_length", report.confirmation.canonical_length},
                       {"honest", group_json(report.confirmation.honest)},
                       {"colluding", group_json(report.confirmation.colluding)},
                       {"miners", miners}};
  return j;
}

} // namespace stats
} // namespace forksim
