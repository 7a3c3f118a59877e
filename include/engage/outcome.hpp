#pragma once

#include <optional>
#include <string>

#include "engage/common.hpp"
#include "engage/json.hpp"

namespace engage {

enum class ActionKind {
    Like,
    Comment,
    Retweet,
    Follow,
};

const char* toString(ActionKind kind);
std::optional<ActionKind> parseActionKind(const std::string& name);

enum class ErrorKind {
    FailedToOpenUrl,
    ScreenshotFailed,
    LikeButtonNotFound,
    CommentButtonNotFound,
    RetweetButtonNotFound,
    FollowButtonNotFound,
    TapFailed,
    TapRetweetButtonFailed,
    TapRepostOptionFailed,
    TapFollowButtonFailed,
    ScreenshotMenuFailed,
    InputFailed,
    PostTapFailed,
    CommentGenerationFailed,
    ImageLoadFailed,
    DeviceUnavailable,
};

// Stable wire names, e.g. "LIKE_BUTTON_NOT_FOUND".
const char* toString(ErrorKind kind);

// Terminal result of one action run. Fields that were never reached stay
// empty; whatever was known at the point of failure is kept.
struct ActionOutcome {
    ActionKind action = ActionKind::Like;
    bool success = false;
    std::optional<ErrorKind> error;
    std::string message;

    std::optional<Point> position;
    double confidence = 0.0;
    int retry_count = 0;

    std::optional<std::string> comment;
    std::optional<std::string> target_username;

    // Retweet confirmation menu. menu_confidence == 0 (with menu_fallback set)
    // marks the configured fallback coordinate; the top-level confidence and
    // position always describe the retweet button itself.
    std::optional<Point> menu_position;
    double menu_confidence = 0.0;
    bool menu_fallback = false;

    std::string debug_screenshot;
};

Json toJson(const ActionOutcome& outcome);

}  // namespace engage
