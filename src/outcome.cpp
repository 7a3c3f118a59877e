#include "engage/outcome.hpp"

#include <algorithm>
#include <cctype>

namespace engage {

const char* toString(ActionKind kind)
{
    switch (kind) {
    case ActionKind::Like: return "like";
    case ActionKind::Comment: return "comment";
    case ActionKind::Retweet: return "retweet";
    case ActionKind::Follow: return "follow";
    }
    return "unknown";
}

std::optional<ActionKind> parseActionKind(const std::string& name)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "like") {
        return ActionKind::Like;
    }
    if (lowered == "comment" || lowered == "ai_comment") {
        return ActionKind::Comment;
    }
    if (lowered == "retweet" || lowered == "repost") {
        return ActionKind::Retweet;
    }
    if (lowered == "follow") {
        return ActionKind::Follow;
    }
    return std::nullopt;
}

const char* toString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::FailedToOpenUrl: return "FAILED_TO_OPEN_URL";
    case ErrorKind::ScreenshotFailed: return "SCREENSHOT_FAILED";
    case ErrorKind::LikeButtonNotFound: return "LIKE_BUTTON_NOT_FOUND";
    case ErrorKind::CommentButtonNotFound: return "COMMENT_BUTTON_NOT_FOUND";
    case ErrorKind::RetweetButtonNotFound: return "RETWEET_BUTTON_NOT_FOUND";
    case ErrorKind::FollowButtonNotFound: return "FOLLOW_BUTTON_NOT_FOUND";
    case ErrorKind::TapFailed: return "TAP_FAILED";
    case ErrorKind::TapRetweetButtonFailed: return "TAP_RETWEET_BUTTON_FAILED";
    case ErrorKind::TapRepostOptionFailed: return "TAP_REPOST_OPTION_FAILED";
    case ErrorKind::TapFollowButtonFailed: return "TAP_FOLLOW_BUTTON_FAILED";
    case ErrorKind::ScreenshotMenuFailed: return "SCREENSHOT_MENU_FAILED";
    case ErrorKind::InputFailed: return "INPUT_FAILED";
    case ErrorKind::PostTapFailed: return "POST_TAP_FAILED";
    case ErrorKind::CommentGenerationFailed: return "COMMENT_GENERATION_FAILED";
    case ErrorKind::ImageLoadFailed: return "IMAGE_LOAD_FAILED";
    case ErrorKind::DeviceUnavailable: return "DEVICE_UNAVAILABLE";
    }
    return "UNKNOWN_ERROR";
}

Json toJson(const ActionOutcome& outcome)
{
    Json root = Json::object();
    root["action"] = toString(outcome.action);
    root["success"] = outcome.success;
    root["error"] = outcome.error ? Json(toString(*outcome.error)) : Json(nullptr);
    if (!outcome.message.empty()) {
        root["message"] = outcome.message;
    }

    root["x"] = outcome.position ? Json(outcome.position->x) : Json(nullptr);
    root["y"] = outcome.position ? Json(outcome.position->y) : Json(nullptr);
    root["confidence"] = outcome.confidence;
    root["retry_count"] = outcome.retry_count;

    if (outcome.comment) {
        root["comment"] = *outcome.comment;
    }
    if (outcome.target_username) {
        root["target_username"] = *outcome.target_username;
    }
    if (outcome.menu_position) {
        root["menu_x"] = outcome.menu_position->x;
        root["menu_y"] = outcome.menu_position->y;
        root["menu_confidence"] = outcome.menu_confidence;
        root["menu_fallback"] = outcome.menu_fallback;
    }
    if (!outcome.debug_screenshot.empty()) {
        root["debug_screenshot"] = outcome.debug_screenshot;
    }
    return root;
}

}  // namespace engage
