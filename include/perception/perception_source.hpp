#pragma once

#include "../core/service_error.hpp"
#include "../types.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace chartagent {
namespace perception {

struct CaptureResponse {
    bool success = false;
    Image image;
    ServiceError error;
};

/**
 * IPerceptionSource - produces one chart image per cycle
 */
class IPerceptionSource {
public:
    virtual ~IPerceptionSource() = default;

    virtual CaptureResponse capture() = 0;
};

/**
 * FilePerceptionSource - reads the screenshot the charting front-end exports
 *
 * The front-end overwrites the file on every refresh; each capture() reads
 * whatever is there now. A missing or empty file is a transient failure.
 */
class FilePerceptionSource : public IPerceptionSource {
public:
    explicit FilePerceptionSource(std::string path) : path_(std::move(path)) {}

    CaptureResponse capture() override {
        CaptureResponse response;

        std::ifstream file(path_, std::ios::binary);
        if (!file.is_open()) {
            response.error = ServiceError::transient("Cannot open screenshot: " + path_);
            return response;
        }

        response.image.bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (response.image.empty()) {
            response.error = ServiceError::transient("Screenshot is empty: " + path_);
            return response;
        }

        response.image.mime_type = mime_type_for(path_);
        response.success = true;
        return response;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;

    static std::string mime_type_for(const std::string& path) {
        auto dot = path.rfind('.');
        if (dot != std::string::npos) {
            std::string ext = path.substr(dot + 1);
            if (ext == "jpg" || ext == "jpeg" || ext == "JPG" || ext == "JPEG") return "image/jpeg";
        }
        return "image/png";
    }
};

} // namespace perception
} // namespace chartagent
