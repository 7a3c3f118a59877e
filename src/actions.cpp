#include "engage/actions.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace engage {
namespace {

std::string stripHandle(const std::string& username)
{
    std::string trimmed = trim(username);
    auto first = trimmed.find_first_not_of('@');
    if (first == std::string::npos) {
        return {};
    }
    return trimmed.substr(first);
}

}  // namespace

LikeAction::LikeAction(std::string post_url) : post_url_(std::move(post_url)) {}

std::string LikeAction::targetUrl(const DeviceProfile&) const
{
    return post_url_;
}

const char* LikeAction::control() const
{
    return controls::kLikeButton;
}

std::chrono::milliseconds LikeAction::openSettle(const Timing& timing) const
{
    return timing.open_like;
}

CommentAction::CommentAction(std::string post_url, std::string persona)
    : post_url_(std::move(post_url)), persona_(std::move(persona)) {}

std::string CommentAction::targetUrl(const DeviceProfile&) const
{
    return post_url_;
}

const char* CommentAction::control() const
{
    return controls::kCommentButton;
}

std::chrono::milliseconds CommentAction::openSettle(const Timing& timing) const
{
    return timing.open_comment;
}

std::optional<ErrorKind> CommentAction::prepare(ActionContext& ctx)
{
    auto frame = ctx.capture("comment_source");
    if (!frame) {
        return ErrorKind::ScreenshotFailed;
    }

    Commenter* commenter = ctx.env().commenter;
    if (!commenter) {
        ctx.outcome().message = "no commenter configured";
        return ErrorKind::CommentGenerationFailed;
    }

    std::optional<std::string> text;
    try {
        text = commenter->describeAndComment(*frame, persona_);
    } catch (const std::exception& ex) {
        ctx.outcome().message = ex.what();
        return ErrorKind::CommentGenerationFailed;
    }
    if (!text || trim(*text).empty()) {
        return ErrorKind::CommentGenerationFailed;
    }

    comment_ = trim(*text);
    ctx.outcome().comment = comment_;
    std::cerr << "[Comment] generated: " << comment_ << std::endl;
    return std::nullopt;
}

std::optional<ErrorKind> CommentAction::continueAfterTap(ActionContext& ctx)
{
    ctx.wait(ctx.env().timing.after_comment_button);
    if (!ctx.device().inputText(comment_)) {
        return ErrorKind::InputFailed;
    }

    ctx.wait(ctx.env().timing.after_input);
    const Point& post = ctx.env().profile.post_button;
    if (!ctx.device().tap(post.x, post.y)) {
        return ErrorKind::PostTapFailed;
    }
    return std::nullopt;
}

RetweetAction::RetweetAction(std::string post_url) : post_url_(std::move(post_url)) {}

std::string RetweetAction::targetUrl(const DeviceProfile&) const
{
    return post_url_;
}

const char* RetweetAction::control() const
{
    return controls::kRetweetButton;
}

std::chrono::milliseconds RetweetAction::openSettle(const Timing& timing) const
{
    return timing.open_retweet;
}

std::optional<ErrorKind> RetweetAction::continueAfterTap(ActionContext& ctx)
{
    ctx.wait(ctx.env().timing.after_retweet_button);

    auto menu = ctx.capture(controls::kRepostOption);
    if (!menu) {
        return ErrorKind::ScreenshotMenuFailed;
    }

    ActionOutcome& outcome = ctx.outcome();
    LocateResult option;
    try {
        option = ctx.env().locator->locate(*menu, controls::kRepostOption, SelectionPolicy::HighestConfidence);
    } catch (const ImageLoadError& ex) {
        outcome.message = ex.what();
        return ErrorKind::ImageLoadFailed;
    }

    if (option.found) {
        outcome.menu_position = Point{option.x, option.y};
        outcome.menu_confidence = option.confidence;
        outcome.menu_fallback = false;
    } else {
        outcome.menu_position = ctx.env().profile.repost_option;
        outcome.menu_confidence = 0.0;
        outcome.menu_fallback = true;
        std::cerr << "[Retweet] repost option not located (best " << option.confidence
                  << "), using fallback (" << outcome.menu_position->x << ", "
                  << outcome.menu_position->y << ")" << std::endl;
    }

    if (!ctx.device().tap(outcome.menu_position->x, outcome.menu_position->y)) {
        return ErrorKind::TapRepostOptionFailed;
    }
    return std::nullopt;
}

FollowAction::FollowAction(std::string username) : username_(stripHandle(username))
{
    if (username_.empty()) {
        throw std::invalid_argument("follow requires a username");
    }
}

std::string FollowAction::targetUrl(const DeviceProfile& profile) const
{
    std::string base = profile.profile_url_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + username_;
}

const char* FollowAction::control() const
{
    return controls::kFollowButton;
}

std::chrono::milliseconds FollowAction::openSettle(const Timing& timing) const
{
    return timing.open_follow;
}

void FollowAction::annotate(ActionOutcome& outcome) const
{
    outcome.target_username = username_;
}

ActionRequest parseActionRequest(const Json& json)
{
    if (!json.is_object()) {
        throw std::runtime_error("Action request must be a JSON object");
    }

    ActionRequest request;
    std::string action = json.get_string("action", "");
    auto kind = parseActionKind(action);
    if (!kind) {
        throw std::runtime_error("Unknown action: '" + action + "'");
    }
    request.kind = *kind;
    request.device = json.get_string("device", json.get_string("device_id", ""));
    request.persona = json.get_string("persona", "");

    if (request.kind == ActionKind::Follow) {
        request.target = stripHandle(json.get_string("username", json.get_string("target_username", "")));
    } else {
        request.target = trim(json.get_string("url", json.get_string("post_url", "")));
    }
    if (request.target.empty()) {
        throw std::runtime_error(std::string("Action '") + toString(request.kind) +
                                 (request.kind == ActionKind::Follow ? "' requires 'username'"
                                                                     : "' requires 'url'"));
    }
    return request;
}

Json toJson(const ActionRequest& request)
{
    Json value = Json::object();
    value["action"] = toString(request.kind);
    value["device"] = request.device;
    value[request.kind == ActionKind::Follow ? "username" : "url"] = request.target;
    if (!request.persona.empty()) {
        value["persona"] = request.persona;
    }
    return value;
}

std::unique_ptr<ActionStrategy> makeStrategy(const ActionRequest& request)
{
    switch (request.kind) {
    case ActionKind::Like:
        return std::make_unique<LikeAction>(request.target);
    case ActionKind::Comment:
        return std::make_unique<CommentAction>(request.target, request.persona);
    case ActionKind::Retweet:
        return std::make_unique<RetweetAction>(request.target);
    case ActionKind::Follow:
        return std::make_unique<FollowAction>(request.target);
    }
    throw std::invalid_argument("Unsupported action kind");
}

ActionOutcome executeLike(Device& device, const ActionEnvironment& env, const std::string& post_url)
{
    LikeAction action(post_url);
    return ActionOrchestrator(device, env).run(action);
}

ActionOutcome executeComment(Device& device, const ActionEnvironment& env,
                             const std::string& post_url, const std::string& persona)
{
    CommentAction action(post_url, persona);
    return ActionOrchestrator(device, env).run(action);
}

ActionOutcome executeRetweet(Device& device, const ActionEnvironment& env, const std::string& post_url)
{
    RetweetAction action(post_url);
    return ActionOrchestrator(device, env).run(action);
}

ActionOutcome executeFollow(Device& device, const ActionEnvironment& env, const std::string& username)
{
    FollowAction action(username);
    return ActionOrchestrator(device, env).run(action);
}

ActionOutcome execute(Device& device, const ActionEnvironment& env, const ActionRequest& request)
{
    auto strategy = makeStrategy(request);
    return ActionOrchestrator(device, env).run(*strategy);
}

}  // namespace engage
