#pragma once

#include "chain/block_tree.hpp"
#include "mining/miner_pool.hpp"
#include "mining/random_source.hpp"
#include "mining/round_simulator.hpp"
#include "stats/report.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace forksim {
namespace app {

// Simulation configuration (defaults match the command-line defaults)
struct SimulationConfig {
  int honest = 3;
  int colluding = 2;
  int rounds = 10000;
  int gap = 5;

  // Output
  bool verbose = false; // per-fork and per-miner report lines
  bool graph = false;   // write a Graphviz file of the tree
  std::filesystem::path graph_path = "blockchain_simulation.dot";
  std::filesystem::path json_path; // empty = no JSON export

  // Unset = draw one from std::random_device (logged for reproduction)
  std::optional<uint64_t> seed;
};

// Throws InvalidConfiguration for negative counts, rounds or gap, or an
// empty miner pool
void ValidateConfig(const SimulationConfig &config);

// Application - Wires the simulation components and runs them in order:
// validate -> build tree/pool/simulator -> run rounds -> analyze -> export
class Application {
public:
  explicit Application(const SimulationConfig &config = SimulationConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool initialize(); // false (and logged) on invalid configuration
  bool run();        // all rounds, then fork and confirmation analysis

  // Write the requested graph/JSON files. True if every requested file was
  // written (or none was requested).
  bool write_exports() const;

  // Text report for stdout
  std::string report_text() const;

  // Component access
  const stats::SimulationReport &report() const { return report_; }
  const chain::BlockTree &tree() const { return *tree_; }
  const mining::MinerPool &pool() const { return *pool_; }
  const SimulationConfig &config() const { return config_; }
  uint64_t seed() const { return seed_; }

  bool is_initialized() const { return initialized_; }
  bool is_finished() const { return finished_; }

private:
  SimulationConfig config_;
  uint64_t seed_{0};
  bool initialized_{false};
  bool finished_{false};

  // Components (initialized in order)
  std::unique_ptr<chain::BlockTree> tree_;
  std::unique_ptr<mining::MinerPool> pool_;
  std::unique_ptr<mining::SeededRandomSource> rng_;
  std::unique_ptr<mining::RoundSimulator> simulator_;

  stats::SimulationReport report_;
};

} // namespace app
} // namespace forksim
