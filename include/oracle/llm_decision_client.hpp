#pragma once

/**
 * LLM decision oracle over an OpenAI-compatible chat/completions endpoint
 *
 * The model sees the snapshot, strategy votes, performance and the last
 * few trades, and must reply with a JSON object:
 *   {"action": "buy"|"sell"|"hold", "confidence": 0-1, "reasoning": [...]}
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../net/http_client.hpp"
#include "idecision_oracle.hpp"

#include <string>

namespace chartagent {
namespace oracle {

struct LlmClientConfig {
    std::string url = config::oracle::DEFAULT_URL;
    std::string model = config::oracle::DEFAULT_MODEL;
    std::string api_key;
    double temperature = config::oracle::TEMPERATURE;
    int32_t max_tokens = config::oracle::MAX_TOKENS;
    uint32_t timeout_ms = config::scheduling::SERVICE_TIMEOUT_MS;
};

class LlmDecisionClient : public IDecisionOracle {
public:
    explicit LlmDecisionClient(LlmClientConfig config, logging::AsyncLogger* logger = nullptr);

    OracleResponse decide(const OracleRequest& request) override;

    std::string_view name() const override { return "llm"; }

    bool is_valid() const { return !config_.api_key.empty() && http_.is_valid(); }

    // Exposed for tests
    static std::string build_prompt(const OracleRequest& request);
    std::string build_request_json(const std::string& prompt) const;
    static bool extract_message_content(const std::string& body, std::string& content);

private:
    LlmClientConfig config_;
    net::HttpClient http_;
    logging::AsyncLogger* logger_;
};

} // namespace oracle
} // namespace chartagent
