#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "engage/config.hpp"
#include "engage/device.hpp"
#include "engage/locator.hpp"
#include "engage/outcome.hpp"

namespace engage {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper threadSleeper();

// Everything an action needs besides the device. Shared read-only between
// concurrent actions; the commenter must tolerate concurrent calls.
struct ActionEnvironment {
    const Locator* locator = nullptr;
    Commenter* commenter = nullptr;
    DeviceProfile profile;
    Timing timing;
    int max_retry = 3;
    std::string capture_dir;
    Sleeper sleep;
};

ActionEnvironment makeEnvironment(const AppConfig& config, const Locator& locator, Commenter* commenter);

enum class ActionState {
    Init,
    Opened,
    Retrying,
    Located,
    Acted,
    Verified,
    Done,
};

const char* toString(ActionState state);

// Per-run view handed to the strategies.
class ActionContext {
public:
    ActionContext(Device& device, const ActionEnvironment& env, ActionOutcome& outcome);

    Device& device() { return device_; }
    const ActionEnvironment& env() const { return env_; }
    ActionOutcome& outcome() { return outcome_; }

    void wait(std::chrono::milliseconds duration) const;

    // Captures a frame and, when a capture directory is configured, keeps a
    // copy on disk as the outcome's debug screenshot.
    std::optional<cv::Mat> capture(const std::string& stage);

private:
    Device& device_;
    const ActionEnvironment& env_;
    ActionOutcome& outcome_;
};

// What differs between like, comment, retweet and follow. The shared
// open / locate-with-scroll / tap / verify protocol lives in the orchestrator.
class ActionStrategy {
public:
    virtual ~ActionStrategy() = default;

    virtual ActionKind kind() const = 0;
    virtual std::string targetUrl(const DeviceProfile& profile) const = 0;
    virtual const char* control() const = 0;
    virtual SelectionPolicy policy() const { return SelectionPolicy::Topmost; }
    virtual std::chrono::milliseconds openSettle(const Timing& timing) const = 0;
    virtual ErrorKind notFoundError() const = 0;
    virtual ErrorKind tapError() const = 0;

    // Called once before the outcome is filled in.
    virtual void annotate(ActionOutcome& outcome) const { (void)outcome; }
    // Runs after the page settled, before the first locate attempt.
    virtual std::optional<ErrorKind> prepare(ActionContext& ctx) { (void)ctx; return std::nullopt; }
    // Runs after the located control was tapped.
    virtual std::optional<ErrorKind> continueAfterTap(ActionContext& ctx) { (void)ctx; return std::nullopt; }
};

class ActionOrchestrator {
public:
    ActionOrchestrator(Device& device, ActionEnvironment env);

    // Never throws for collaborator failures; every terminal state is
    // reported through the returned outcome.
    ActionOutcome run(ActionStrategy& strategy);

private:
    Device& device_;
    ActionEnvironment env_;
};

}  // namespace engage
