#include "engage/config.hpp"

#include <iostream>
#include <stdexcept>

namespace engage {
namespace {

std::string resolvePath(const std::filesystem::path& baseDir, const std::string& path)
{
    if (path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.lexically_normal().generic_string();
    }
    return (baseDir / p).lexically_normal().generic_string();
}

std::chrono::milliseconds parseDelay(const Json& node, const std::string& key, std::chrono::milliseconds fallback)
{
    int value = node.get_int(key, static_cast<int>(fallback.count()));
    if (value < 0) {
        throw std::runtime_error("timing." + key + " must not be negative");
    }
    return std::chrono::milliseconds(value);
}

ServiceInfo parseService(const Json& node)
{
    ServiceInfo service;
    service.name = node.get_string("name", service.name);
    service.description = node.get_string("description", "");
    return service;
}

DeviceProfile parseDevice(const Json& node)
{
    DeviceProfile profile;
    profile.name = node.get_string("name", profile.name);
    profile.width = node.get_int("width", profile.width);
    profile.height = node.get_int("height", profile.height);
    if (profile.width <= 0 || profile.height <= 0) {
        throw std::runtime_error("device width and height must be positive");
    }
    profile.adb_path = node.get_string("adb_path", profile.adb_path);
    profile.browser_package = node.get_string("browser_package", profile.browser_package);
    profile.profile_url_base = node.get_string("profile_url_base", profile.profile_url_base);

    if (node.contains("swipe")) {
        const auto& swipe = node["swipe"];
        profile.swipe.from.x = swipe.get_int("from_x", profile.swipe.from.x);
        profile.swipe.from.y = swipe.get_int("from_y", profile.swipe.from.y);
        profile.swipe.to.x = swipe.get_int("to_x", profile.swipe.to.x);
        profile.swipe.to.y = swipe.get_int("to_y", profile.swipe.to.y);
        profile.swipe.duration_ms = swipe.get_int("duration_ms", profile.swipe.duration_ms);
    }
    if (node.contains("post_button")) {
        profile.post_button = parsePoint(node["post_button"], profile.post_button);
    }
    if (node.contains("repost_option")) {
        profile.repost_option = parsePoint(node["repost_option"], profile.repost_option);
    }
    return profile;
}

Timing parseTiming(const Json& node)
{
    Timing timing;
    timing.open_like = parseDelay(node, "open_like", timing.open_like);
    timing.open_comment = parseDelay(node, "open_comment", timing.open_comment);
    timing.open_retweet = parseDelay(node, "open_retweet", timing.open_retweet);
    timing.open_follow = parseDelay(node, "open_follow", timing.open_follow);
    timing.after_scroll = parseDelay(node, "after_scroll", timing.after_scroll);
    timing.after_tap = parseDelay(node, "after_tap", timing.after_tap);
    timing.after_comment_button = parseDelay(node, "after_comment_button", timing.after_comment_button);
    timing.after_input = parseDelay(node, "after_input", timing.after_input);
    timing.after_retweet_button = parseDelay(node, "after_retweet_button", timing.after_retweet_button);
    return timing;
}

LocatorConfig parseLocator(const Json& node, const std::filesystem::path& baseDir)
{
    LocatorConfig locator;
    locator.max_retry = node.get_int("max_retry", locator.max_retry);
    if (locator.max_retry < 1) {
        throw std::runtime_error("locator.max_retry must be at least 1");
    }
    locator.dedup_radius = node.get_int("dedup_radius", locator.dedup_radius);
    if (locator.dedup_radius < 0) {
        throw std::runtime_error("locator.dedup_radius must not be negative");
    }
    locator.grayscale = node.get_bool("grayscale", locator.grayscale);
    locator.templates = resolvePath(baseDir, node.get_string("templates", ""));
    return locator;
}

MqttConfig parseMqtt(const Json& node)
{
    MqttConfig mqtt;
    mqtt.server = node.get_string("server", mqtt.server);
    mqtt.port = node.get_int("port", mqtt.port);
    mqtt.client_id = node.get_string("client_id", mqtt.client_id);
    mqtt.subscribe_topic = node.get_string("subscribe_topic", mqtt.subscribe_topic);
    mqtt.publish_topic = node.get_string("publish_topic", mqtt.publish_topic);
    mqtt.heartbeat_topic = node.get_string("heartbeat_topic", mqtt.heartbeat_topic);
    mqtt.username = node.get_string("username", mqtt.username);
    mqtt.password = node.get_string("password", mqtt.password);
    mqtt.heartbeat_time = node.get_int("heartbeat_time", mqtt.heartbeat_time);
    return mqtt;
}

}  // namespace

Timing Timing::zero()
{
    Timing timing;
    timing.open_like = timing.open_comment = timing.open_retweet = timing.open_follow =
        std::chrono::milliseconds(0);
    timing.after_scroll = timing.after_tap = timing.after_comment_button = timing.after_input =
        timing.after_retweet_button = std::chrono::milliseconds(0);
    return timing;
}

AppConfig parseConfig(const Json& root, const std::filesystem::path& baseDir)
{
    if (!root.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    AppConfig config;
    config.version = root.get_string("version", "");

    if (root.contains("service")) {
        config.service = parseService(root["service"]);
    }
    if (root.contains("device")) {
        config.device = parseDevice(root["device"]);
    }
    if (root.contains("timing")) {
        config.timing = parseTiming(root["timing"]);
    }
    if (!root.contains("locator")) {
        throw std::runtime_error("Configuration missing 'locator' section");
    }
    config.locator = parseLocator(root["locator"], baseDir);

    if (root.contains("commenter")) {
        config.commenter.command = root["commenter"].get_string("command", "");
    }
    if (root.contains("debug")) {
        config.debug.capture_dir = resolvePath(baseDir, root["debug"].get_string("capture_dir", ""));
    }
    if (root.contains("mqtt")) {
        config.mqtt = parseMqtt(root["mqtt"]);
    }

    config.thread_pool_size = root.get_int("thread_pool_size", config.thread_pool_size);
    if (config.thread_pool_size < 1) {
        throw std::runtime_error("thread_pool_size must be at least 1");
    }
    return config;
}

AppConfig loadConfig(const std::string& path)
{
    Json root = Json::parse_file(path);

    std::filesystem::path absolutePath = std::filesystem::absolute(path).lexically_normal();
    std::filesystem::path baseDir = absolutePath.has_parent_path() ? absolutePath.parent_path()
                                                                   : std::filesystem::path(".");

    AppConfig config = parseConfig(root, baseDir);
    config.source_path = absolutePath.generic_string();

    std::cerr << "[Config] loaded " << config.source_path << " (device profile " << config.device.name
              << ", max_retry " << config.locator.max_retry << ")" << std::endl;
    return config;
}

Json configSnapshot(const AppConfig& config)
{
    Json root = Json::object();
    root["service_name"] = config.service.name;
    if (!config.service.description.empty()) {
        root["description"] = config.service.description;
    }
    if (!config.version.empty()) {
        root["version"] = config.version;
    }
    root["client_id"] = config.mqtt.client_id;
    root["subscribe_topic"] = config.mqtt.subscribe_topic;
    root["publish_topic"] = config.mqtt.publish_topic;

    Json device = Json::object();
    device["name"] = config.device.name;
    device["width"] = config.device.width;
    device["height"] = config.device.height;
    device["post_button"] = pointToJson(config.device.post_button);
    device["repost_option"] = pointToJson(config.device.repost_option);
    root["device"] = device;

    Json locator = Json::object();
    locator["max_retry"] = config.locator.max_retry;
    locator["dedup_radius"] = config.locator.dedup_radius;
    locator["grayscale"] = config.locator.grayscale;
    locator["templates"] = config.locator.templates;
    root["locator"] = locator;
    return root;
}

}  // namespace engage
