#pragma once

/**
 * CLI utilities for the bot runner
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace tradebot {
namespace util {

/**
 * Command-line arguments for bot_runner.
 */
struct CLIArgs {
    bool help = false;
    bool verbose = false;
    bool json_output = false;       // print each evaluation as JSON
    std::string config_path;
    std::string data_dir = ".";     // <data_dir>/<pair>.csv
    std::map<std::string, std::string> candle_files; // pair -> csv, overrides data_dir
    int steps = 0;                  // 0 = replay every candle
    int warmup = 50;                // candles skipped before the first cycle
};

/**
 * Print help message for bot_runner.
 */
inline void print_help() {
    std::cout << R"(
tradebot runner (paper replay)
==============================

Usage: bot_runner --config FILE [options]

Options:
  -c, --config FILE      JSON configuration (safety, sizing, executor, bots)
  -d, --data-dir DIR     Directory with <PAIR>.csv candle files (default: .)
  --candles PAIR=FILE    Candle file for one pair (repeatable)
  -n, --steps N          Number of replay steps (0 = all, default)
  -w, --warmup N         Candles to skip before the first cycle (default: 50)
  --json                 Print every evaluation as JSON
  -v, --verbose          Debug logging
  -h, --help             Show this help

CSV format: open_time,open,high,low,close,volume (open_time in ms)

Examples:
  bot_runner -c examples/bots.json -d examples
  bot_runner -c bots.json --candles BTC-USD=btc_1h.csv -n 200 -v
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
            } else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            } else if (arg == "--json") {
                args.json_output = true;
            } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if ((arg == "--data-dir" || arg == "-d") && i + 1 < argc) {
                args.data_dir = argv[++i];
            } else if (arg == "--candles" && i + 1 < argc) {
                std::string spec = argv[++i];
                auto eq = spec.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                    std::cerr << "--candles expects PAIR=FILE, got: " << spec << "\n";
                    return false;
                }
                args.candle_files[spec.substr(0, eq)] = spec.substr(eq + 1);
            } else if ((arg == "--steps" || arg == "-n") && i + 1 < argc) {
                args.steps = std::stoi(argv[++i]);
            } else if ((arg == "--warmup" || arg == "-w") && i + 1 < argc) {
                args.warmup = std::stoi(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return false;
    }

    if (!args.help && args.config_path.empty()) {
        std::cerr << "--config is required\n";
        return false;
    }
    if (args.steps < 0 || args.warmup < 0) {
        std::cerr << "--steps and --warmup must not be negative\n";
        return false;
    }
    return true;
}

} // namespace util
} // namespace tradebot
