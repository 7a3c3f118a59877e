#include "engage/adb_device.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace engage {

AdbDevice::AdbDevice(std::string serial, DeviceProfile profile)
    : serial_(std::move(serial)), profile_(std::move(profile)) {}

std::string AdbDevice::adbPrefix() const
{
    std::string prefix = shellQuote(profile_.adb_path);
    if (!serial_.empty()) {
        prefix += " -s " + shellQuote(serial_);
    }
    return prefix;
}

bool AdbDevice::shell(const std::string& arguments, const char* what)
{
    const std::string command = adbPrefix() + " shell " + arguments + " 2>&1";
    ProcessResult result;
    try {
        result = runProcess(command);
    } catch (const std::runtime_error& ex) {
        std::cerr << "[ADB] " << serial_ << ": " << what << " failed: " << ex.what() << std::endl;
        return false;
    }
    if (result.exit_status != 0) {
        std::cerr << "[ADB] " << serial_ << ": " << what << " exited with " << result.exit_status;
        std::string output = trim(result.output);
        if (!output.empty()) {
            std::cerr << ": " << output;
        }
        std::cerr << std::endl;
        return false;
    }
    return true;
}

bool AdbDevice::openUrl(const std::string& url)
{
    std::ostringstream args;
    args << "am start -a android.intent.action.VIEW -d " << shellQuote(shellQuote(url));
    if (!profile_.browser_package.empty()) {
        args << " -p " << shellQuote(profile_.browser_package);
    }
    return shell(args.str(), "open url");
}

std::optional<cv::Mat> AdbDevice::capture()
{
    const std::string command = adbPrefix() + " exec-out screencap -p 2>/dev/null";
    ProcessResult result;
    try {
        result = runProcess(command);
    } catch (const std::runtime_error& ex) {
        std::cerr << "[ADB] " << serial_ << ": screencap failed: " << ex.what() << std::endl;
        return std::nullopt;
    }
    if (result.exit_status != 0 || result.output.empty()) {
        std::cerr << "[ADB] " << serial_ << ": screencap returned no image (status "
                  << result.exit_status << ")" << std::endl;
        return std::nullopt;
    }

    std::vector<std::uint8_t> encoded(result.output.begin(), result.output.end());
    try {
        return decodeFrame(encoded);
    } catch (const ImageLoadError& ex) {
        std::cerr << "[ADB] " << serial_ << ": " << ex.what() << std::endl;
        return std::nullopt;
    }
}

bool AdbDevice::tap(int x, int y)
{
    std::ostringstream args;
    args << "input tap " << x << ' ' << y;
    return shell(args.str(), "tap");
}

bool AdbDevice::swipeDown()
{
    const SwipeGesture& swipe = profile_.swipe;
    std::ostringstream args;
    args << "input swipe " << swipe.from.x << ' ' << swipe.from.y << ' '
         << swipe.to.x << ' ' << swipe.to.y << ' ' << swipe.duration_ms;
    return shell(args.str(), "swipe");
}

// Text goes through the ADBKeyboard broadcast receiver, which handles
// characters `input text` cannot type.
bool AdbDevice::inputText(const std::string& text)
{
    std::string args = "am broadcast -a ADB_INPUT_TEXT --es msg " + shellQuote(shellQuote(text));
    return shell(args, "input text");
}

}  // namespace engage
