#pragma once

#include "../config/defaults.hpp"
#include "../core/service_error.hpp"
#include "../types.hpp"

#include <vector>

namespace chartagent {
namespace perception {

struct ParseOptions {
    double box_threshold = config::parsing::BOX_THRESHOLD;
    double iou_threshold = config::parsing::IOU_THRESHOLD;
    bool normalize_coordinates = config::parsing::NORMALIZE_COORDINATES;
};

struct ParseResponse {
    bool success = false;
    std::vector<ParsedElement> elements;
    ServiceError error;
};

/**
 * IParsingService - turns a chart image into labelled UI elements
 */
class IParsingService {
public:
    virtual ~IParsingService() = default;

    virtual ParseResponse parse(const Image& image, const ParseOptions& options) = 0;
};

} // namespace perception
} // namespace chartagent
