#include "../../include/config/agent_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace chartagent::config {

using json = nlohmann::json;

bool oracle_mode_from_string(const std::string& s, OracleMode& out) {
    if (s == "llm") {
        out = OracleMode::Llm;
        return true;
    }
    if (s == "rules" || s == "rule" || s == "offline") {
        out = OracleMode::Rules;
        return true;
    }
    return false;
}

std::vector<std::string> AgentConfig::validate() const {
    std::vector<std::string> problems;
    if (instrument.empty()) problems.push_back("instrument is empty");
    if (lot_size <= 0) problems.push_back("lot_size must be positive");
    if (polling_interval_ms == 0) problems.push_back("polling_interval_ms must be positive");
    if (service_timeout_ms == 0) problems.push_back("service_timeout_ms must be positive");
    if (failure_threshold <= 0) problems.push_back("failure_threshold must be positive");
    if (screenshot_path.empty()) problems.push_back("screenshot_path is empty");
    if (state_file.empty()) problems.push_back("state_file is empty");
    if (!paper_trading && execution_url.empty()) problems.push_back("execution_url required for live trading");
    return problems;
}

bool load_config_file(const std::string& path, AgentConfig& cfg, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open config file: " + path;
        return false;
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            error = "Config root must be an object";
            return false;
        }

        cfg.instrument = j.value("instrument", cfg.instrument);
        cfg.lot_size = j.value("lot_size", cfg.lot_size);
        cfg.paper_trading = j.value("paper_trading", cfg.paper_trading);
        cfg.paper_balance = j.value("paper_balance", cfg.paper_balance);

        cfg.polling_interval_ms = j.value("polling_interval_ms", cfg.polling_interval_ms);
        cfg.service_timeout_ms = j.value("service_timeout_ms", cfg.service_timeout_ms);
        cfg.failure_threshold = j.value("failure_threshold", cfg.failure_threshold);

        cfg.screenshot_path = j.value("screenshot_path", cfg.screenshot_path);
        cfg.parser_url = j.value("parser_url", cfg.parser_url);
        if (j.contains("parse_options") && j["parse_options"].is_object()) {
            const auto& p = j["parse_options"];
            cfg.box_threshold = p.value("box_threshold", cfg.box_threshold);
            cfg.iou_threshold = p.value("iou_threshold", cfg.iou_threshold);
            cfg.normalize_coordinates = p.value("normalize_coordinates", cfg.normalize_coordinates);
        }

        if (j.contains("oracle") && j["oracle"].is_object()) {
            const auto& o = j["oracle"];
            std::string mode = o.value("mode", std::string(oracle_mode_to_string(cfg.oracle_mode)));
            if (!oracle_mode_from_string(mode, cfg.oracle_mode)) {
                error = "Unknown oracle mode: " + mode;
                return false;
            }
            cfg.oracle_url = o.value("url", cfg.oracle_url);
            cfg.oracle_model = o.value("model", cfg.oracle_model);
            cfg.oracle_temperature = o.value("temperature", cfg.oracle_temperature);
        }

        cfg.execution_url = j.value("execution_url", cfg.execution_url);
        cfg.state_file = j.value("state_file", cfg.state_file);
        cfg.export_directory = j.value("export_directory", cfg.export_directory);
    } catch (const json::exception& e) {
        error = std::string("Invalid config JSON: ") + e.what();
        return false;
    }
    return true;
}

std::string load_from_env_file(const std::string& name, const std::vector<std::string>& search_paths) {
    for (const auto& path : search_paths) {
        std::ifstream file(path);
        if (!file.is_open()) continue;

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#') continue;

            if (line.rfind("export ", 0) == 0) line = line.substr(7);
            if (line.rfind(name + "=", 0) != 0) continue;

            std::string value = line.substr(name.size() + 1);
            if (!value.empty() && value.back() == '\r') value.pop_back();

            // Remove surrounding quotes if present
            if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                      (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }
            if (!value.empty()) return value;
        }
    }
    return "";
}

void apply_environment(AgentConfig& cfg) {
    auto read = [](const char* name) -> std::string {
        const char* env = std::getenv(name);
        if (env && *env) return env;
        return load_from_env_file(name);
    };

    std::string key = read("OPENAI_API_KEY");
    if (!key.empty()) cfg.openai_api_key = key;

    key = read("EXECUTION_API_KEY");
    if (!key.empty()) cfg.execution_api_key = key;

    if (const char* url = std::getenv("PARSER_URL"); url && *url) cfg.parser_url = url;
    if (const char* url = std::getenv("OPENAI_API_URL"); url && *url) cfg.oracle_url = url;
}

} // namespace chartagent::config
