#pragma once

/**
 * OmniParser HTTP client
 *
 * Request:  POST {base_url}/parse/
 *           {"image": <base64>, "box_threshold": f, "iou_threshold": f,
 *            "normalize_coordinates": b}
 * Response: {"parsed_content_list": [{"type": "text"|"icon",
 *            "content": str, "bbox": [x1, y1, x2, y2]}, ...]}
 */

#include "../logging/async_logger.hpp"
#include "../net/http_client.hpp"
#include "parsing_service.hpp"

#include <string>

namespace chartagent {
namespace perception {

class OmniParserClient : public IParsingService {
public:
    OmniParserClient(std::string base_url, uint32_t timeout_ms, logging::AsyncLogger* logger = nullptr);

    ParseResponse parse(const Image& image, const ParseOptions& options) override;

    /**
     * Decode a response body. Entries without usable content are dropped.
     * Exposed for tests.
     */
    static bool parse_response_body(const std::string& body, ParseResponse& response);

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    net::HttpClient http_;
    logging::AsyncLogger* logger_;
};

} // namespace perception
} // namespace chartagent
