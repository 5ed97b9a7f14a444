#include "../../include/perception/omniparser_client.hpp"
#include "../../include/util/base64.hpp"

#include <nlohmann/json.hpp>

namespace chartagent::perception {

using json = nlohmann::json;

OmniParserClient::OmniParserClient(std::string base_url, uint32_t timeout_ms, logging::AsyncLogger* logger)
    : http_(timeout_ms), logger_(logger) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    endpoint_ = base_url + "/parse/";
}

ParseResponse OmniParserClient::parse(const Image& image, const ParseOptions& options) {
    ParseResponse response;

    if (image.empty()) {
        response.error = ServiceError::transient("Empty image");
        return response;
    }

    json request = {
        {"image", util::base64_encode(image.bytes)},
        {"box_threshold", options.box_threshold},
        {"iou_threshold", options.iou_threshold},
        {"normalize_coordinates", options.normalize_coordinates},
    };

    auto http = http_.post_json(endpoint_, request.dump());
    if (!http.success) {
        response.error = http.error;
        CA_LOGF(logger_, Warn, Perception, "Parse request failed: %s", http.error.message.c_str());
        return response;
    }

    if (!parse_response_body(http.body, response)) {
        response.error = ServiceError::transient("Unexpected parser response");
        CA_LOGF(logger_, Warn, Perception, "Unexpected parser response (%zu bytes)", http.body.size());
        return response;
    }

    CA_LOGF(logger_, Debug, Perception, "Parsed %zu elements in %u ms", response.elements.size(),
            http.latency_ms);
    response.success = true;
    return response;
}

bool OmniParserClient::parse_response_body(const std::string& body, ParseResponse& response) {
    try {
        json data = json::parse(body);
        if (!data.contains("parsed_content_list") || !data["parsed_content_list"].is_array()) {
            return false;
        }

        for (const auto& item : data["parsed_content_list"]) {
            if (!item.is_object()) continue;

            ParsedElement element;
            element.kind = item.value("type", std::string("text")) == "icon" ? ElementKind::Icon : ElementKind::Text;

            if (item.contains("content") && item["content"].is_string()) {
                element.text = item["content"].get<std::string>();
            }
            if (element.text.empty()) continue;

            if (item.contains("bbox") && item["bbox"].is_array() && item["bbox"].size() == 4) {
                const auto& b = item["bbox"];
                if (b[0].is_number() && b[1].is_number() && b[2].is_number() && b[3].is_number()) {
                    element.bounding_box =
                        Rect{b[0].get<double>(), b[1].get<double>(), b[2].get<double>(), b[3].get<double>()};
                }
            }

            response.elements.push_back(std::move(element));
        }
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

} // namespace chartagent::perception
