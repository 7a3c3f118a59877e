#pragma once

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "engage/device.hpp"
#include "engage/locator.hpp"
#include "engage/orchestrator.hpp"

namespace engage::fakes {

// Scripted device. Every call is recorded in `calls` so tests can assert on
// the exact command sequence.
class FakeDevice : public Device {
public:
    bool openUrl(const std::string& url) override {
        calls.push_back("open " + url);
        opened.push_back(url);
        return open_ok;
    }

    std::optional<cv::Mat> capture() override {
        calls.push_back("capture");
        ++captures;
        if (!scripted_frames.empty()) {
            auto next = scripted_frames.front();
            scripted_frames.pop_front();
            return next;
        }
        if (capture_fails) {
            return std::nullopt;
        }
        return cv::Mat(64, 64, CV_8UC3, cv::Scalar(20, 20, 20));
    }

    bool tap(int x, int y) override {
        calls.push_back("tap " + std::to_string(x) + "," + std::to_string(y));
        taps.push_back(Point{x, y});
        if (!tap_results.empty()) {
            bool ok = tap_results.front();
            tap_results.pop_front();
            return ok;
        }
        return true;
    }

    bool swipeDown() override {
        calls.push_back("swipe");
        ++swipes;
        return swipe_ok;
    }

    bool inputText(const std::string& text) override {
        calls.push_back("input " + text);
        inputs.push_back(text);
        return input_ok;
    }

    bool open_ok = true;
    bool swipe_ok = true;
    bool input_ok = true;
    bool capture_fails = false;
    std::deque<std::optional<cv::Mat>> scripted_frames;
    std::deque<bool> tap_results;

    std::vector<std::string> calls;
    std::vector<std::string> opened;
    std::vector<Point> taps;
    std::vector<std::string> inputs;
    int captures = 0;
    int swipes = 0;
};

// Returns queued results per control; anything unscripted is "not found".
class FakeLocator : public Locator {
public:
    LocateResult locate(const cv::Mat& frame,
                        const std::string& control,
                        SelectionPolicy policy) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        (void)frame;
        requests.emplace_back(control, policy);
        if (control == throw_for) {
            throw ImageLoadError("Template '" + control + "' is larger than the frame");
        }
        auto it = scripted.find(control);
        if (it != scripted.end() && !it->second.empty()) {
            LocateResult next = it->second.front();
            it->second.pop_front();
            return next;
        }
        return fallback;
    }

    void script(const std::string& control, LocateResult result) {
        scripted[control].push_back(result);
    }

    std::size_t countFor(const std::string& control) const {
        std::size_t count = 0;
        for (const auto& request : requests) {
            if (request.first == control) {
                ++count;
            }
        }
        return count;
    }

    mutable std::map<std::string, std::deque<LocateResult>> scripted;
    mutable std::vector<std::pair<std::string, SelectionPolicy>> requests;
    std::string throw_for;
    LocateResult fallback = LocateResult::NotFound(0.2);

private:
    mutable std::mutex mutex_;
};

class FakeCommenter : public Commenter {
public:
    explicit FakeCommenter(std::optional<std::string> reply) : reply_(std::move(reply)) {}

    std::optional<std::string> describeAndComment(const cv::Mat& frame,
                                                  const std::string& persona) override {
        ++calls;
        last_persona = persona;
        last_frame_empty = frame.empty();
        return reply_;
    }

    int calls = 0;
    std::string last_persona;
    bool last_frame_empty = true;

private:
    std::optional<std::string> reply_;
};

struct SleepLog {
    std::vector<std::chrono::milliseconds> waits;
};

inline ActionEnvironment makeTestEnvironment(const Locator& locator,
                                             Commenter* commenter,
                                             std::shared_ptr<SleepLog> log = nullptr)
{
    ActionEnvironment env;
    env.locator = &locator;
    env.commenter = commenter;
    env.max_retry = 3;
    if (log) {
        env.sleep = [log](std::chrono::milliseconds d) { log->waits.push_back(d); };
    } else {
        env.timing = Timing::zero();
        env.sleep = [](std::chrono::milliseconds) {};
    }
    return env;
}

}  // namespace engage::fakes
