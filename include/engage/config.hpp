#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "engage/common.hpp"
#include "engage/json.hpp"

namespace engage {

struct ServiceInfo {
    std::string name = "engage";
    std::string description;
};

struct SwipeGesture {
    Point from{540, 1500};
    Point to{540, 500};
    int duration_ms = 500;
};

// Screen geometry and the fixed coordinates that only hold for one
// resolution. Defaults describe a 1080x1920 device.
struct DeviceProfile {
    std::string name = "1080x1920";
    int width = 1080;
    int height = 1920;
    std::string adb_path = "adb";
    std::string browser_package = "com.android.chrome";
    SwipeGesture swipe;
    Point post_button{980, 350};
    Point repost_option{230, 1440};
    std::string profile_url_base = "https://x.com";
};

// Blind waits standing in for a "rendering finished" signal.
struct Timing {
    std::chrono::milliseconds open_like{10000};
    std::chrono::milliseconds open_comment{10000};
    std::chrono::milliseconds open_retweet{10000};
    std::chrono::milliseconds open_follow{8000};
    std::chrono::milliseconds after_scroll{2000};
    std::chrono::milliseconds after_tap{1000};
    std::chrono::milliseconds after_comment_button{3000};
    std::chrono::milliseconds after_input{1000};
    std::chrono::milliseconds after_retweet_button{2000};

    static Timing zero();
};

struct LocatorConfig {
    int max_retry = 3;
    int dedup_radius = 50;
    bool grayscale = false;
    std::string templates;
};

struct CommenterConfig {
    std::string command;
};

struct DebugConfig {
    std::string capture_dir;
};

struct MqttConfig {
    std::string server;
    int port = 1883;
    std::string client_id = "engage";
    std::string subscribe_topic = "engage/actions";
    std::string publish_topic = "engage/results";
    std::string heartbeat_topic = "engage/heartbeat";
    std::string username;
    std::string password;
    int heartbeat_time = 10;
};

struct AppConfig {
    std::string version;
    std::string source_path;
    ServiceInfo service;
    DeviceProfile device;
    Timing timing;
    LocatorConfig locator;
    CommenterConfig commenter;
    DebugConfig debug;
    MqttConfig mqtt;
    int thread_pool_size = 1;
};

// Relative paths (template manifest, capture directory) resolve against
// `baseDir`. Throws std::runtime_error on invalid values.
AppConfig parseConfig(const Json& root, const std::filesystem::path& baseDir);
AppConfig loadConfig(const std::string& path);

Json configSnapshot(const AppConfig& config);

}  // namespace engage
