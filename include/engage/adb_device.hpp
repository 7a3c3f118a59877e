#pragma once

#include <string>

#include "engage/config.hpp"
#include "engage/device.hpp"

namespace engage {

// Drives one Android handset through the adb command line tool.
class AdbDevice : public Device {
public:
    AdbDevice(std::string serial, DeviceProfile profile);

    bool openUrl(const std::string& url) override;
    std::optional<cv::Mat> capture() override;
    bool tap(int x, int y) override;
    bool swipeDown() override;
    bool inputText(const std::string& text) override;

    const std::string& serial() const { return serial_; }

private:
    std::string adbPrefix() const;
    bool shell(const std::string& arguments, const char* what);

    std::string serial_;
    DeviceProfile profile_;
};

}  // namespace engage
