#pragma once

/**
 * RestTradeExecutor - live orders through a broker REST API
 *
 * Request:  POST {base_url}/orders
 *           {"client_order_id", "instrument", "side", "lots",
 *            "stop_loss_distance"?, "take_profit_distance"?}
 * Response: {"order_id", "fill_price"?, "profit_loss"?, "status"}
 *           or {"error": "..."} with the message classified into a category
 */

#include "../config/defaults.hpp"
#include "../logging/async_logger.hpp"
#include "../net/http_client.hpp"
#include "itrade_executor.hpp"

#include <string>

namespace chartagent {
namespace execution {

class RestTradeExecutor : public ITradeExecutor {
public:
    RestTradeExecutor(std::string base_url, std::string api_key,
                      uint32_t timeout_ms = config::scheduling::SERVICE_TIMEOUT_MS,
                      logging::AsyncLogger* logger = nullptr);

    ExecutionResponse execute(const ExecutionRequest& request) override;

    std::string_view name() const override { return "rest"; }

    // Exposed for tests
    static std::string build_order_json(const ExecutionRequest& request);
    static bool parse_order_response(const std::string& body, const ExecutionRequest& request,
                                     ExecutionResponse& response);

private:
    std::string endpoint_;
    std::string api_key_;
    net::HttpClient http_;
    logging::AsyncLogger* logger_;
};

} // namespace execution
} // namespace chartagent
