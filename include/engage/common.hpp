#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "engage/json.hpp"

namespace engage {

// Device pixel coordinate.
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// A frame or template that cannot be used for matching. Never folded into
// "not found".
class ImageLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Point parsePoint(const Json& value, Point fallback);
Json pointToJson(const Point& point);

// Decodes PNG/JPEG bytes into a BGR frame. Throws ImageLoadError.
cv::Mat decodeFrame(const std::vector<std::uint8_t>& encoded);
// Loads an image file into a BGR frame. Throws ImageLoadError.
cv::Mat loadImageFile(const std::string& path);

std::string currentIsoTimestamp();
std::string trim(const std::string& value);
std::string sanitizeName(const std::string& name);
// Wraps a value in single quotes for /bin/sh.
std::string shellQuote(const std::string& value);

struct ProcessResult {
    int exit_status = -1;
    std::string output;
};

// Runs a shell command and collects its stdout. Throws std::runtime_error
// when the process cannot be started.
ProcessResult runProcess(const std::string& command);

std::filesystem::path ensureCaptureDirectory(const std::string& root, const std::string& action);
// Best-effort: returns an empty string when the frame could not be written.
std::string saveFrameToDisk(const std::filesystem::path& directory,
                            const std::string& stem,
                            const cv::Mat& frame);

}  // namespace engage
