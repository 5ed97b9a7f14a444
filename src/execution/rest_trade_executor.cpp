#include "../../include/execution/rest_trade_executor.hpp"
#include "../../include/safety/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

namespace chartagent::execution {

using json = nlohmann::json;

RestTradeExecutor::RestTradeExecutor(std::string base_url, std::string api_key, uint32_t timeout_ms,
                                     logging::AsyncLogger* logger)
    : api_key_(std::move(api_key)), http_(timeout_ms), logger_(logger) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    endpoint_ = base_url + "/orders";
}

ExecutionResponse RestTradeExecutor::execute(const ExecutionRequest& request) {
    ExecutionResponse response;

    if (api_key_.empty()) {
        response.error = ServiceError{ErrorCategory::CredentialInvalid, "API key invalid: no execution API key"};
        return response;
    }

    auto http = http_.post_json(endpoint_, build_order_json(request), {"Authorization: Bearer " + api_key_});
    if (!http.success) {
        response.error = http.error;
        CA_LOGF(logger_, Error, Execution, "Order failed: %s", http.error.message.c_str());
        return response;
    }

    if (!parse_order_response(http.body, request, response)) {
        CA_LOGF(logger_, Error, Execution, "Order rejected: %s", response.error.message.c_str());
        return response;
    }

    CA_LOGF(logger_, Info, Execution, "[LIVE] %s %.2f lots %s -> order %s (%u ms)",
            direction_to_string(request.direction), request.lot_size, request.instrument.c_str(),
            response.result.order_id.c_str(), http.latency_ms);
    return response;
}

std::string RestTradeExecutor::build_order_json(const ExecutionRequest& request) {
    json order = {
        {"client_order_id", "agent-" + std::to_string(request.trade_id)},
        {"instrument", request.instrument},
        {"side", direction_to_string(request.direction)},
        {"lots", request.lot_size},
    };
    if (request.stop_loss_distance) order["stop_loss_distance"] = *request.stop_loss_distance;
    if (request.take_profit_distance) order["take_profit_distance"] = *request.take_profit_distance;
    return order.dump();
}

bool RestTradeExecutor::parse_order_response(const std::string& body, const ExecutionRequest& request,
                                             ExecutionResponse& response) {
    try {
        json data = json::parse(body);

        if (data.contains("error") && !data["error"].is_null()) {
            std::string message = data["error"].is_string() ? data["error"].get<std::string>() : data["error"].dump();
            response.error = ServiceError{safety::classify_error_message(message), message};
            return false;
        }

        ExecutionResult& result = response.result;
        if (data.contains("order_id") && data["order_id"].is_string()) {
            result.order_id = data["order_id"].get<std::string>();
        } else if (data.contains("order_id") && data["order_id"].is_number_integer()) {
            result.order_id = std::to_string(data["order_id"].get<int64_t>());
        } else {
            response.error = ServiceError::transient("Order response without order_id");
            return false;
        }

        if (data.contains("fill_price") && data["fill_price"].is_number()) {
            result.fill_price = data["fill_price"].get<double>();
        }
        if (data.contains("profit_loss") && data["profit_loss"].is_number()) {
            result.profit_loss = data["profit_loss"].get<double>();
        }
        result.message = data.value("status", std::string("accepted"));
        result.direction = request.direction;
        result.lot_size = request.lot_size;
        result.success = true;
        response.success = true;
        return true;
    } catch (const json::exception& e) {
        response.error = ServiceError::transient(std::string("Bad order response: ") + e.what());
        return false;
    }
}

} // namespace chartagent::execution
