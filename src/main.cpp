// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "application.hpp"
#include "harness/run_config.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char* program_name) {
  std::cout << "pgprobe - verify privacy group authorization against declared membership\n\n"
            << "Usage: " << program_name << " --config=<path> [options]\n\n"
            << "Options:\n"
            << "  --config=<path>      Run plan (JSON): nodes, identities, groups, probe\n"
            << "  --report=<path>      Also write the report as JSON to <path>\n"
            << "  --workers=<n>        Concurrent group workers (default: one per reachable node)\n"
            << "  --loglevel=<level>   trace, debug, info, warn, error, off (default: info)\n"
            << "  --logfile=<path>     Also log to <path>\n"
            << "  --version            Show version information\n"
            << "  --help               Show this help message\n\n"
            << "Exit codes:\n"
            << "  0  clean: no breach, leakage or inconclusive case\n"
            << "  1  findings\n"
            << "  2  fatal error (bad run plan, identity resolution failed, no reachable node)\n"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  try {
    std::string config_path;
    std::string report_path;
    std::string log_level = "info";
    std::string log_file;
    std::optional<size_t> workers;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << pgprobe::GetFullVersionString() << std::endl;
        std::cout << pgprobe::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--config=")) {
        config_path = arg.substr(9);
      } else if (arg.starts_with("--report=")) {
        report_path = arg.substr(9);
        if (report_path.empty()) {
          std::cerr << "Error: --report requires a non-empty path\n";
          return pgprobe::harness::EXIT_FATAL;
        }
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--logfile=")) {
        log_file = arg.substr(10);
      } else if (arg.starts_with("--workers=")) {
        std::string value = arg.substr(10);
        size_t n = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || ptr != value.data() + value.size() || n == 0) {
          std::cerr << "Error: --workers requires a positive integer\n";
          return pgprobe::harness::EXIT_FATAL;
        }
        workers = n;
      } else {
        std::cerr << "Error: unknown option " << arg << "\n";
        PrintUsage(argv[0]);
        return pgprobe::harness::EXIT_FATAL;
      }
    }

    if (config_path.empty()) {
      std::cerr << "Error: --config is required\n";
      PrintUsage(argv[0]);
      return pgprobe::harness::EXIT_FATAL;
    }

    pgprobe::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
    std::cerr << pgprobe::GetStartupBanner() << std::flush;

    pgprobe::app::AppConfig config;
    config.run = pgprobe::harness::LoadRunConfig(config_path);
    config.report_path = report_path;
    if (workers) {
      config.run.max_group_workers = *workers;
    }

    pgprobe::app::Application app(config);
    app.initialize();
    int code = app.run();

    pgprobe::util::LogManager::Shutdown();
    return code;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    pgprobe::util::LogManager::Shutdown();
    return pgprobe::harness::EXIT_FATAL;
  }
}
