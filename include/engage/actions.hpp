#pragma once

#include <memory>
#include <string>

#include "engage/orchestrator.hpp"

namespace engage {

class LikeAction : public ActionStrategy {
public:
    explicit LikeAction(std::string post_url);

    ActionKind kind() const override { return ActionKind::Like; }
    std::string targetUrl(const DeviceProfile& profile) const override;
    const char* control() const override;
    std::chrono::milliseconds openSettle(const Timing& timing) const override;
    ErrorKind notFoundError() const override { return ErrorKind::LikeButtonNotFound; }
    ErrorKind tapError() const override { return ErrorKind::TapFailed; }

private:
    std::string post_url_;
};

// Generates the reply from the first settled frame before looking for the
// comment button, types it into the composer and taps the profile's fixed
// post button.
class CommentAction : public ActionStrategy {
public:
    CommentAction(std::string post_url, std::string persona);

    ActionKind kind() const override { return ActionKind::Comment; }
    std::string targetUrl(const DeviceProfile& profile) const override;
    const char* control() const override;
    std::chrono::milliseconds openSettle(const Timing& timing) const override;
    ErrorKind notFoundError() const override { return ErrorKind::CommentButtonNotFound; }
    ErrorKind tapError() const override { return ErrorKind::TapFailed; }

    std::optional<ErrorKind> prepare(ActionContext& ctx) override;
    std::optional<ErrorKind> continueAfterTap(ActionContext& ctx) override;

private:
    std::string post_url_;
    std::string persona_;
    std::string comment_;
};

// Taps the retweet control, then confirms through the repost menu. The menu
// option is located visually when possible and otherwise tapped at the
// profile's fallback coordinate.
class RetweetAction : public ActionStrategy {
public:
    explicit RetweetAction(std::string post_url);

    ActionKind kind() const override { return ActionKind::Retweet; }
    std::string targetUrl(const DeviceProfile& profile) const override;
    const char* control() const override;
    std::chrono::milliseconds openSettle(const Timing& timing) const override;
    ErrorKind notFoundError() const override { return ErrorKind::RetweetButtonNotFound; }
    ErrorKind tapError() const override { return ErrorKind::TapRetweetButtonFailed; }

    std::optional<ErrorKind> continueAfterTap(ActionContext& ctx) override;

private:
    std::string post_url_;
};

class FollowAction : public ActionStrategy {
public:
    explicit FollowAction(std::string username);

    ActionKind kind() const override { return ActionKind::Follow; }
    std::string targetUrl(const DeviceProfile& profile) const override;
    const char* control() const override;
    std::chrono::milliseconds openSettle(const Timing& timing) const override;
    ErrorKind notFoundError() const override { return ErrorKind::FollowButtonNotFound; }
    ErrorKind tapError() const override { return ErrorKind::TapFollowButtonFailed; }

    void annotate(ActionOutcome& outcome) const override;

    const std::string& username() const { return username_; }

private:
    std::string username_;
};

// One job for a device: target is a post URL, or a username for follow.
struct ActionRequest {
    ActionKind kind = ActionKind::Like;
    std::string device;
    std::string target;
    std::string persona;
};

ActionRequest parseActionRequest(const Json& json);
Json toJson(const ActionRequest& request);

std::unique_ptr<ActionStrategy> makeStrategy(const ActionRequest& request);

ActionOutcome executeLike(Device& device, const ActionEnvironment& env, const std::string& post_url);
ActionOutcome executeComment(Device& device, const ActionEnvironment& env,
                             const std::string& post_url, const std::string& persona);
ActionOutcome executeRetweet(Device& device, const ActionEnvironment& env, const std::string& post_url);
ActionOutcome executeFollow(Device& device, const ActionEnvironment& env, const std::string& username);
ActionOutcome execute(Device& device, const ActionEnvironment& env, const ActionRequest& request);

}  // namespace engage
