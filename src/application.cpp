#include "application.hpp"
#include "errors.hpp"
#include "stats/confirmation_analyzer.hpp"
#include "stats/fork_analyzer.hpp"
#include "stats/graph_export.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <chrono>

namespace forksim {
namespace app {

void ValidateConfig(const SimulationConfig &config) {
  if (config.honest < 0) {
    throw InvalidConfiguration("honest must be >= 0 (got " +
                               std::to_string(config.honest) + ")");
  }
  if (config.colluding < 0) {
    throw InvalidConfiguration("colluding must be >= 0 (got " +
                               std::to_string(config.colluding) + ")");
  }
  if (config.honest == 0 && config.colluding == 0) {
    throw InvalidConfiguration("at least one miner is required");
  }
  if (config.rounds < 0) {
    throw InvalidConfiguration("rounds must be >= 0 (got " +
                               std::to_string(config.rounds) + ")");
  }
  if (config.gap < 0) {
    throw InvalidConfiguration("gap must be >= 0 (got " + std::to_string(config.gap) +
                               ")");
  }
  if (config.graph && config.graph_path.empty()) {
    throw InvalidConfiguration("graph output requested without a path");
  }
}

Application::Application(const SimulationConfig &config) : config_(config) {}

Application::~Application() = default;

bool Application::initialize() {
  if (initialized_) {
    LOG_APP_ERROR("Application already initialized");
    return false;
  }

  try {
    ValidateConfig(config_);
  } catch (const InvalidConfiguration &e) {
    LOG_APP_ERROR("{}", e.what());
    return false;
  }

  seed_ = config_.seed ? *config_.seed : mining::GenerateSeed();

  tree_ = std::make_unique<chain::BlockTree>();
  pool_ = std::make_unique<mining::MinerPool>(config_.honest, config_.colluding,
                                              config_.gap);
  rng_ = std::make_unique<mining::SeededRandomSource>(seed_);
  simulator_ = std::make_unique<mining::RoundSimulator>(*tree_, *pool_, *rng_);

  LOG_APP_INFO("Simulation: {} honest, {} colluding, {} rounds, gap {}, seed {}",
               config_.honest, config_.colluding, config_.rounds, config_.gap, seed_);

  initialized_ = true;
  return true;
}

bool Application::run() {
  if (!initialized_) {
    LOG_APP_ERROR("Application::run called before initialize");
    return false;
  }
  if (finished_) {
    LOG_APP_ERROR("Simulation already ran");
    return false;
  }

  auto start = std::chrono::steady_clock::now();
  simulator_->Run(config_.rounds);
  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();

  const mining::ColludingStrategy &colluding = pool_->GetColludingStrategy();

  report_.honest = pool_->GetHonestCount();
  report_.colluding = pool_->GetColludingCount();
  report_.rounds = simulator_->RoundsCompleted();
  report_.gap = colluding.GetGap();
  report_.seed = rng_->GetSeed();
  report_.forks = stats::ForkAnalyzer(*tree_).Analyze();
  report_.confirmation = stats::ConfirmationAnalyzer(*tree_).Analyze(*pool_);
  report_.colluding_abandon_count = colluding.GetAbandonCount();
  report_.reorg_count = tree_->GetReorgCount();
  report_.max_reorg_depth = tree_->GetMaxReorgDepth();

  if (report_.colluding > 0 && colluding.GetForkTip() != chain::NULL_BLOCK_ID) {
    LOG_APP_DEBUG("Colluding fork ends at block {} (adopted at height {}), {} "
                  "fork(s) abandoned",
                  colluding.GetForkTip(), colluding.GetForkAdoptedHeight(),
                  report_.colluding_abandon_count);
  }

  LOG_APP_INFO("Simulation finished in {} ms: {} blocks, canonical height {}, {} fork(s)",
               elapsed_ms, tree_->GetBlockCount(), tree_->CanonicalTip().nHeight,
               report_.forks.fork_count);

  finished_ = true;
  return true;
}

bool Application::write_exports() const {
  if (!finished_) {
    LOG_APP_ERROR("Nothing to export: simulation has not run");
    return false;
  }

  bool ok = true;

  if (config_.graph) {
    if (util::atomic_write_file(config_.graph_path, stats::ToDot(*tree_))) {
      LOG_APP_INFO("Graph written to {} (render with: dot -Tpng -O {})",
               config_.graph_path.string(), config_.graph_path.string());
    } else {
      LOG_APP_ERROR("Failed to write graph to {}", config_.graph_path.string());
      ok = false;
    }
  }

  if (!config_.json_path.empty()) {
    nlohmann::json j = stats::ToJson(report_);
    j["blocks"] = stats::BlocksToJson(*tree_);
    if (util::atomic_write_file(config_.json_path, j.dump(2) + "\n")) {
      LOG_APP_INFO("JSON report written to {}", config_.json_path.string());
    } else {
      LOG_APP_ERROR("Failed to write JSON report to {}", config_.json_path.string());
      ok = false;
    }
  }

  return ok;
}

std::string Application::report_text() const {
  return stats::FormatReport(report_, config_.verbose);
}

} // namespace app
} // namespace forksim
