#pragma once

/**
 * CLI utilities for the chart agent
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace chartagent {
namespace util {

/**
 * Command-line arguments for the agent. Unset optionals keep the
 * config file value.
 */
struct CLIArgs {
    std::string config_path;
    bool paper_mode = false;
    bool live_mode = false;
    std::string oracle_mode;   // "llm" | "rules"
    uint32_t interval_ms = 0;  // 0 = from config
    double lot_size = 0;       // 0 = from config
    std::string pair;
    std::string image_path;
    bool once = false;         // Single cycle, then exit
    int duration = 0;          // Seconds, 0 = unlimited
    bool export_history = false;
    bool verbose = false;
    bool help = false;
};

/**
 * Print help message for the agent.
 */
inline void print_help() {
    std::cout << R"(
Chart Trading Agent
===================

Usage: chart_agent [options]

Modes:
  --paper, -p            Paper trading - simulated fills (default)
  --live                 Live trading through the execution API

Options:
  -c, --config FILE      JSON config file
  -o, --oracle MODE      Decision oracle: llm | rules (default: llm)
  -i, --interval SECS    Seconds between cycles (default: 30)
  -l, --lot LOTS         Base lot size (default: 0.01)
  --pair PAIR            Instrument, e.g. EURUSD
  --image FILE           Chart screenshot exported by the front-end
  --once                 Run a single cycle and exit
  -d, --duration SECS    Stop after SECS seconds (0 = unlimited)
  --export               Write trade_history_<timestamp>.json on exit
  -v, --verbose          Debug logging
  -h, --help             Show this help

Environment:
  OPENAI_API_KEY         Oracle credentials (or in .env.local)
  EXECUTION_API_KEY      Broker credentials for --live
  PARSER_URL             OmniParser base URL

Examples:
  chart_agent --paper --oracle rules --image chart.png
  chart_agent -c agent.json --once -v

WARNING: With --live, REAL orders will be sent!
)";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--paper" || arg == "-p") {
                args.paper_mode = true;
            }
            else if (arg == "--live") {
                args.live_mode = true;
            }
            else if (arg == "--help" || arg == "-h") {
                args.help = true;
            }
            else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            }
            else if (arg == "--once") {
                args.once = true;
            }
            else if (arg == "--export") {
                args.export_history = true;
            }
            else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
                args.config_path = argv[++i];
            }
            else if ((arg == "--oracle" || arg == "-o") && i + 1 < argc) {
                args.oracle_mode = argv[++i];
            }
            else if ((arg == "--interval" || arg == "-i") && i + 1 < argc) {
                int secs = std::stoi(argv[++i]);
                if (secs <= 0) {
                    std::cerr << "Interval must be positive\n";
                    return false;
                }
                args.interval_ms = static_cast<uint32_t>(secs) * 1000;
            }
            else if ((arg == "--lot" || arg == "-l") && i + 1 < argc) {
                args.lot_size = std::stod(argv[++i]);
            }
            else if (arg == "--pair" && i + 1 < argc) {
                args.pair = argv[++i];
            }
            else if (arg == "--image" && i + 1 < argc) {
                args.image_path = argv[++i];
            }
            else if ((arg == "--duration" || arg == "-d") && i + 1 < argc) {
                args.duration = std::stoi(argv[++i]);
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi / std::stod on a non-number
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return false;
    }

    if (args.paper_mode && args.live_mode) {
        std::cerr << "--paper and --live are mutually exclusive\n";
        return false;
    }
    return true;
}

}  // namespace util
}  // namespace chartagent
