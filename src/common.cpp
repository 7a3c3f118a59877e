#include "engage/common.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>

#include <sys/wait.h>

#include <opencv2/imgcodecs.hpp>

namespace engage {

Point parsePoint(const Json& value, Point fallback)
{
    if (value.is_null()) {
        return fallback;
    }
    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.size() != 2) {
            throw std::runtime_error("Point must be an array of two integers");
        }
        return Point{arr[0].as_int(), arr[1].as_int()};
    }
    if (!value.is_object()) {
        throw std::runtime_error("Point must be an object with x and y");
    }
    Point point;
    point.x = value.get_int("x", fallback.x);
    point.y = value.get_int("y", fallback.y);
    return point;
}

Json pointToJson(const Point& point)
{
    Json value = Json::object();
    value["x"] = point.x;
    value["y"] = point.y;
    return value;
}

cv::Mat decodeFrame(const std::vector<std::uint8_t>& encoded)
{
    if (encoded.empty()) {
        throw ImageLoadError("Captured frame has no data");
    }
    cv::Mat buffer(1, static_cast<int>(encoded.size()), CV_8UC1,
                   const_cast<std::uint8_t*>(encoded.data()));
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageLoadError("Failed to decode encoded frame");
    }
    return image;
}

cv::Mat loadImageFile(const std::string& path)
{
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageLoadError("Failed to load image: " + path);
    }
    return image;
}

std::string currentIsoTimestamp()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    auto time = clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << fractional.count() << "Z";
    return oss.str();
}

std::string trim(const std::string& value)
{
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::string sanitizeName(const std::string& name)
{
    std::string sanitized;
    sanitized.reserve(name.size());
    for (char ch : name) {
        if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_' || ch == '.') {
            sanitized.push_back(ch);
        }
    }
    if (sanitized.empty()) {
        sanitized = "captures";
    }
    return sanitized;
}

std::string shellQuote(const std::string& value)
{
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

ProcessResult runProcess(const std::string& command)
{
    ProcessResult result;
    int exitStatus = -1;
    {
        auto closer = [&exitStatus](FILE* f) {
            if (f) {
                exitStatus = pclose(f);
            }
        };
        std::unique_ptr<FILE, decltype(closer)> pipe(popen(command.c_str(), "r"), closer);
        if (!pipe) {
            throw std::runtime_error("Failed to execute: " + command);
        }

        std::array<char, 4096> buffer{};
        std::size_t count = 0;
        while ((count = std::fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
            result.output.append(buffer.data(), count);
        }
    }
    if (exitStatus != -1 && WIFEXITED(exitStatus)) {
        result.exit_status = WEXITSTATUS(exitStatus);
    }
    return result;
}

std::filesystem::path ensureCaptureDirectory(const std::string& root, const std::string& action)
{
    std::filesystem::path directory = root.empty() ? std::filesystem::path("captures")
                                                   : std::filesystem::path(root);
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "[Capture] cannot create " << directory << ": " << ec.message() << std::endl;
        return {};
    }
    if (!action.empty()) {
        std::filesystem::path actionDir = directory / sanitizeName(action);
        std::error_code actionEc;
        std::filesystem::create_directories(actionDir, actionEc);
        if (!actionEc) {
            directory = actionDir;
        }
    }
    return directory;
}

std::string saveFrameToDisk(const std::filesystem::path& directory,
                            const std::string& stem,
                            const cv::Mat& frame)
{
    if (directory.empty() || frame.empty()) {
        return {};
    }

    static std::atomic<unsigned> sequence{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream name;
    name << sanitizeName(stem) << '_' << ms << '_' << std::setw(4) << std::setfill('0')
         << (sequence.fetch_add(1) % 10000) << ".png";

    std::filesystem::path filePath = directory / name.str();
    try {
        if (!cv::imwrite(filePath.string(), frame)) {
            std::cerr << "[Capture] failed to write " << filePath << std::endl;
            return {};
        }
    } catch (const cv::Exception& ex) {
        std::cerr << "[Capture] failed to write " << filePath << ": " << ex.what() << std::endl;
        return {};
    }
    return filePath.generic_string();
}

}  // namespace engage
