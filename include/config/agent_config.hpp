#pragma once

/**
 * AgentConfig - runtime configuration of the chart agent
 *
 * Precedence, lowest to highest:
 *   1. Compile-time defaults (defaults.hpp)
 *   2. JSON config file (--config)
 *   3. Environment / .env.local (credentials and endpoints only)
 *   4. Command-line flags
 *
 * Example file:
 *   {
 *     "instrument": "EURUSD",
 *     "polling_interval_ms": 30000,
 *     "lot_size": 0.01,
 *     "paper_trading": true,
 *     "screenshot_path": "chart.png",
 *     "parser_url": "http://localhost:8000",
 *     "oracle": {"mode": "llm", "url": "...", "model": "gpt-4"},
 *     "state_file": "agent_state.json"
 *   }
 */

#include "defaults.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chartagent {
namespace config {

enum class OracleMode : uint8_t { Llm = 0, Rules };

inline const char* oracle_mode_to_string(OracleMode mode) {
    switch (mode) {
        case OracleMode::Llm: return "llm";
        case OracleMode::Rules: return "rules";
        default: return "unknown";
    }
}

bool oracle_mode_from_string(const std::string& s, OracleMode& out);

struct AgentConfig {
    // Trading
    std::string instrument = trading::DEFAULT_INSTRUMENT;
    double lot_size = trading::DEFAULT_LOT_SIZE;
    bool paper_trading = flags::PAPER_TRADING;
    double paper_balance = 10000.0;

    // Scheduling
    uint32_t polling_interval_ms = scheduling::POLLING_INTERVAL_MS;
    uint32_t service_timeout_ms = scheduling::SERVICE_TIMEOUT_MS;
    int32_t failure_threshold = breaker::FAILURE_THRESHOLD;

    // Perception
    std::string screenshot_path = "chart.png";
    std::string parser_url = "http://localhost:8000";
    double box_threshold = parsing::BOX_THRESHOLD;
    double iou_threshold = parsing::IOU_THRESHOLD;
    bool normalize_coordinates = parsing::NORMALIZE_COORDINATES;

    // Oracle
    OracleMode oracle_mode = OracleMode::Llm;
    std::string oracle_url = oracle::DEFAULT_URL;
    std::string oracle_model = oracle::DEFAULT_MODEL;
    double oracle_temperature = oracle::TEMPERATURE;
    std::string openai_api_key;

    // Live execution
    std::string execution_url = "http://localhost:8080/api";
    std::string execution_api_key;

    // Persistence
    std::string state_file = "agent_state.json";
    std::string export_directory = ".";

    /**
     * Problems that make the configuration unusable. Empty when valid.
     */
    std::vector<std::string> validate() const;
};

/**
 * Merge a JSON config file into cfg. Unknown keys are ignored.
 * @return false (with error) if the file cannot be read or parsed
 */
bool load_config_file(const std::string& path, AgentConfig& cfg, std::string& error);

/**
 * Read OPENAI_API_KEY, EXECUTION_API_KEY, PARSER_URL, OPENAI_API_URL from
 * the environment, falling back to .env.local for keys that are unset.
 */
void apply_environment(AgentConfig& cfg);

/**
 * Value of NAME=value (or export NAME=value) from the first .env.local
 * found in the current or parent directories. Quotes are stripped.
 */
std::string load_from_env_file(const std::string& name, const std::vector<std::string>& search_paths = {
                                                             ".env.local", "../.env.local", "../../.env.local"});

} // namespace config
} // namespace chartagent
