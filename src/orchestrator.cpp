#include "engage/orchestrator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace engage {
namespace {

ActionOutcome& fail(ActionOutcome& outcome, ErrorKind error)
{
    outcome.success = false;
    outcome.error = error;
    std::cerr << "[Orchestrator] " << toString(outcome.action) << " failed: " << toString(error);
    if (!outcome.message.empty()) {
        std::cerr << " (" << outcome.message << ")";
    }
    std::cerr << std::endl;
    return outcome;
}

}  // namespace

Sleeper threadSleeper()
{
    return [](std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    };
}

ActionEnvironment makeEnvironment(const AppConfig& config, const Locator& locator, Commenter* commenter)
{
    ActionEnvironment env;
    env.locator = &locator;
    env.commenter = commenter;
    env.profile = config.device;
    env.timing = config.timing;
    env.max_retry = config.locator.max_retry;
    env.capture_dir = config.debug.capture_dir;
    env.sleep = threadSleeper();
    return env;
}

const char* toString(ActionState state)
{
    switch (state) {
    case ActionState::Init: return "init";
    case ActionState::Opened: return "opened";
    case ActionState::Retrying: return "retrying";
    case ActionState::Located: return "located";
    case ActionState::Acted: return "acted";
    case ActionState::Verified: return "verified";
    case ActionState::Done: return "done";
    }
    return "unknown";
}

ActionContext::ActionContext(Device& device, const ActionEnvironment& env, ActionOutcome& outcome)
    : device_(device), env_(env), outcome_(outcome) {}

void ActionContext::wait(std::chrono::milliseconds duration) const
{
    if (env_.sleep) {
        env_.sleep(duration);
    }
}

std::optional<cv::Mat> ActionContext::capture(const std::string& stage)
{
    std::optional<cv::Mat> frame = device_.capture();
    if (!frame || frame->empty()) {
        std::cerr << "[Orchestrator] screenshot failed (" << stage << ")" << std::endl;
        return std::nullopt;
    }
    if (!env_.capture_dir.empty()) {
        auto directory = ensureCaptureDirectory(env_.capture_dir, toString(outcome_.action));
        std::string path = saveFrameToDisk(directory, stage, *frame);
        if (!path.empty()) {
            outcome_.debug_screenshot = path;
        }
    }
    return frame;
}

ActionOrchestrator::ActionOrchestrator(Device& device, ActionEnvironment env)
    : device_(device), env_(std::move(env))
{
    if (!env_.locator) {
        throw std::invalid_argument("ActionOrchestrator requires a locator");
    }
    if (env_.max_retry < 1) {
        throw std::invalid_argument("max_retry must be at least 1");
    }
}

ActionOutcome ActionOrchestrator::run(ActionStrategy& strategy)
{
    ActionOutcome outcome;
    outcome.action = strategy.kind();
    strategy.annotate(outcome);

    ActionContext ctx(device_, env_, outcome);
    const char* name = toString(outcome.action);
    const std::string url = strategy.targetUrl(env_.profile);

    ActionState state = ActionState::Init;
    double bestConfidence = 0.0;
    LocateResult located;

    while (state != ActionState::Done) {
        switch (state) {
        case ActionState::Init:
            std::cerr << "[Orchestrator] " << name << ": opening " << url << std::endl;
            if (!device_.openUrl(url)) {
                return fail(outcome, ErrorKind::FailedToOpenUrl);
            }
            state = ActionState::Opened;
            break;

        case ActionState::Opened:
            ctx.wait(strategy.openSettle(env_.timing));
            if (auto error = strategy.prepare(ctx)) {
                return fail(outcome, *error);
            }
            state = ActionState::Retrying;
            break;

        case ActionState::Retrying: {
            const int attempt = outcome.retry_count + 1;
            outcome.retry_count = attempt;
            std::cerr << "[Orchestrator] " << name << ": locating " << strategy.control()
                      << ", attempt " << attempt << "/" << env_.max_retry << std::endl;

            if (auto frame = ctx.capture(strategy.control())) {
                try {
                    located = env_.locator->locate(*frame, strategy.control(), strategy.policy());
                } catch (const ImageLoadError& ex) {
                    outcome.message = ex.what();
                    outcome.confidence = bestConfidence;
                    return fail(outcome, ErrorKind::ImageLoadFailed);
                }
                if (located.found) {
                    outcome.position = Point{located.x, located.y};
                    outcome.confidence = located.confidence;
                    state = ActionState::Located;
                    break;
                }
                bestConfidence = std::max(bestConfidence, located.confidence);
            }

            if (attempt >= env_.max_retry) {
                outcome.confidence = bestConfidence;
                return fail(outcome, strategy.notFoundError());
            }
            if (!device_.swipeDown()) {
                std::cerr << "[Orchestrator] " << name << ": scroll gesture rejected" << std::endl;
            }
            ctx.wait(env_.timing.after_scroll);
            break;
        }

        case ActionState::Located:
            std::cerr << "[Orchestrator] " << name << ": tapping " << strategy.control() << " at ("
                      << outcome.position->x << ", " << outcome.position->y << ")" << std::endl;
            if (!device_.tap(outcome.position->x, outcome.position->y)) {
                return fail(outcome, strategy.tapError());
            }
            state = ActionState::Acted;
            break;

        case ActionState::Acted:
            if (auto error = strategy.continueAfterTap(ctx)) {
                return fail(outcome, *error);
            }
            state = ActionState::Verified;
            break;

        case ActionState::Verified:
            ctx.wait(env_.timing.after_tap);
            // Confirmation screenshot is best-effort and never affects success.
            if (!ctx.capture("confirmation")) {
                std::cerr << "[Orchestrator] " << name << ": confirmation screenshot skipped" << std::endl;
            }
            outcome.success = true;
            outcome.error.reset();
            state = ActionState::Done;
            break;

        case ActionState::Done:
            break;
        }
    }

    std::cerr << "[Orchestrator] " << name << " succeeded after " << outcome.retry_count
              << " attempt(s)" << std::endl;
    return outcome;
}

}  // namespace engage
