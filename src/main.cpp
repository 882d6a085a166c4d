#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <climits>
#include <iostream> // CLI output and early errors before logger initialized
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Simulate mining with honest and colluding miners.\n"
      << "\n"
      << "Options:\n"
      << "  --honest=<n>         Number of honest miners (default: 3)\n"
      << "  --colluding=<n>      Number of colluding miners (default: 2)\n"
      << "  --rounds=<n>         Number of mining rounds to simulate (default: 10000)\n"
      << "  --gap=<n>            Gap allowed on colluding fork (default: 5)\n"
      << "  --seed=<n>           Random seed (default: random, printed in the log)\n"
      << "  --verbose            Print per-fork and per-miner statistics\n"
      << "  --graph[=<path>]     Write a Graphviz graph of the block tree\n"
      << "                       (default: blockchain_simulation.dot)\n"
      << "  --json=<path>        Write statistics and blocks as JSON\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: warn\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, sim, stats, app, all\n"
      << "                       Can be comma-separated: --debug=chain,sim\n"
      << "  --logfile=<path>     Log to a file instead of stderr\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

// Parse "--name=<int>" into target; prints the error and returns false on bad input
static bool ParseIntOption(const std::string &arg, const std::string &prefix, int min,
                           int max, int &target) {
  auto value = forksim::util::SafeParseInt(arg.substr(prefix.size()), min, max);
  if (!value) {
    std::cerr << "Error: Invalid value for " << prefix.substr(0, prefix.size() - 1)
              << ": " << arg.substr(prefix.size()) << std::endl;
    std::cerr << "Value must be a number between " << min << " and " << max
              << std::endl;
    return false;
  }
  target = *value;
  return true;
}

int main(int argc, char *argv[]) {
  try {
    forksim::app::SimulationConfig config;
    std::string log_level = "warn";
    std::string log_file;
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << forksim::GetFullVersionString() << std::endl;
        std::cout << forksim::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--honest=") == 0) {
        if (!ParseIntOption(arg, "--honest=", 0, INT_MAX, config.honest))
          return 1;
      } else if (arg.find("--colluding=") == 0) {
        if (!ParseIntOption(arg, "--colluding=", 0, INT_MAX, config.colluding))
          return 1;
      } else if (arg.find("--rounds=") == 0) {
        if (!ParseIntOption(arg, "--rounds=", 0, INT_MAX, config.rounds))
          return 1;
      } else if (arg.find("--gap=") == 0) {
        if (!ParseIntOption(arg, "--gap=", 0, INT_MAX, config.gap))
          return 1;
      } else if (arg.find("--seed=") == 0) {
        auto seed = forksim::util::SafeParseUInt64(arg.substr(7));
        if (!seed) {
          std::cerr << "Error: Invalid seed: " << arg.substr(7) << std::endl;
          return 1;
        }
        config.seed = *seed;
      } else if (arg == "--verbose") {
        config.verbose = true;
      } else if (arg == "--graph") {
        config.graph = true;
      } else if (arg.find("--graph=") == 0) {
        config.graph = true;
        config.graph_path = arg.substr(8);
      } else if (arg.find("--json=") == 0) {
        config.json_path = arg.substr(7);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : forksim::util::SplitString(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    forksim::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        forksim::util::LogManager::SetLogLevel("trace");
      } else {
        forksim::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;
    {
      forksim::app::Application app(config);

      if (!app.initialize()) {
        LOG_APP_ERROR("Failed to initialize simulation");
        forksim::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.run()) {
        LOG_APP_ERROR("Simulation failed");
        forksim::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.write_exports()) {
        exit_code = 1;
      }

      std::cout << app.report_text() << std::flush;
    }

    forksim::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    forksim::util::LogManager::Shutdown();
    return 1;
  }
}
