#pragma once

#include <optional>
#include <string>

#include <opencv2/core.hpp>

namespace engage {

// Remote device control channel. Every call is a synchronous round trip;
// a false/empty return means the device rejected or failed the request.
class Device {
public:
    virtual ~Device() = default;

    virtual bool openUrl(const std::string& url) = 0;
    virtual std::optional<cv::Mat> capture() = 0;
    virtual bool tap(int x, int y) = 0;
    virtual bool swipeDown() = 0;
    virtual bool inputText(const std::string& text) = 0;
};

// Vision-language reply generation for a pictured post.
class Commenter {
public:
    virtual ~Commenter() = default;

    virtual std::optional<std::string> describeAndComment(const cv::Mat& frame,
                                                          const std::string& persona) = 0;
};

}  // namespace engage
