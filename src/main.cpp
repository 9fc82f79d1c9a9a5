#include "replay/scenario.hpp"
#include "reporting/error_reporter.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and errors before the logger is initialized
#include <memory>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " --scenario=<file> [options]\n"
      << "\n"
      << "Replays a block scenario through the wallet block listener and\n"
      << "prints the resulting wallet states as JSON.\n"
      << "\n"
      << "Options:\n"
      << "  --scenario=<file>    Scenario JSON file (required)\n"
      << "  --window=<n>         Blocks per apply window (default: 1)\n"
      << "  --rollback=<n>       Blocks to roll back after applying (default: 0)\n"
      << "  --report-file=<path> Append wallet sync failure reports (JSON lines)\n"
      << "                       Default: report to the log\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: wallet, chain, slotting, app, all\n"
      << "                       Can be comma-separated: --debug=wallet,chain\n"
      << "  --secure-log=<path>  Write unredacted wallet messages to this file\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    walletsync::replay::ReplayConfig config;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << walletsync::GetFullVersionString() << std::endl;
        std::cout << walletsync::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--scenario=") == 0) {
        config.scenario_path = arg.substr(11);
      } else if (arg.find("--window=") == 0) {
        auto window_opt = walletsync::util::SafeParseInt(arg.substr(9), 1, 100000);
        if (!window_opt) {
          std::cerr << "Error: Invalid window size: " << arg.substr(9) << std::endl;
          std::cerr << "Window must be a number between 1 and 100000" << std::endl;
          return 1;
        }
        config.window = static_cast<size_t>(*window_opt);
      } else if (arg.find("--rollback=") == 0) {
        auto rollback_opt = walletsync::util::SafeParseInt(arg.substr(11), 0, 100000);
        if (!rollback_opt) {
          std::cerr << "Error: Invalid rollback depth: " << arg.substr(11) << std::endl;
          std::cerr << "Depth must be a number between 0 and 100000" << std::endl;
          return 1;
        }
        config.rollback = static_cast<size_t>(*rollback_opt);
      } else if (arg.find("--report-file=") == 0) {
        config.report_file = arg.substr(14);
      } else if (arg.find("--secure-log=") == 0) {
        config.secure_log = arg.substr(13);
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        for (const auto &component : walletsync::util::SplitCommaList(arg.substr(8))) {
          config.debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.scenario_path.empty()) {
      std::cerr << "Error: --scenario is required" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    // Log to file: stdout carries only the JSON result
    walletsync::util::LogManager::Initialize(config.log_level, true, "walletsync-replay.log",
                                             config.secure_log.string());

    for (const auto &component : config.debug_components) {
      if (component == "all") {
        walletsync::util::LogManager::SetLogLevel("trace");
      } else {
        walletsync::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;
    {
      std::unique_ptr<walletsync::reporting::ErrorReporter> reporter;
      if (config.report_file.empty()) {
        reporter = std::make_unique<walletsync::reporting::LoggingErrorReporter>();
      } else {
        reporter = std::make_unique<walletsync::reporting::FileErrorReporter>(config.report_file);
      }

      try {
        auto scenario = walletsync::replay::LoadScenario(config.scenario_path);
        auto result = walletsync::replay::RunScenario(scenario, config, *reporter);
        std::cout << result.dump(2) << std::endl;
      } catch (const walletsync::replay::ScenarioError &e) {
        LOG_APP_ERROR("Replay failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
      }
    }

    walletsync::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    walletsync::util::LogManager::Shutdown();
    return 1;
  }
}
