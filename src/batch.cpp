#include "engage/batch.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "engage/thread_pool.hpp"

namespace engage {
namespace {

ActionOutcome unavailable(const ActionRequest& request, const std::string& message)
{
    ActionOutcome outcome;
    outcome.action = request.kind;
    outcome.success = false;
    outcome.error = ErrorKind::DeviceUnavailable;
    outcome.message = message;
    if (request.kind == ActionKind::Follow) {
        outcome.target_username = request.target;
    }
    return outcome;
}

}  // namespace

std::vector<ActionRequest> parseJobList(const Json& json)
{
    std::vector<ActionRequest> jobs;
    if (json.is_array()) {
        for (const auto& item : json.as_array()) {
            jobs.push_back(parseActionRequest(item));
        }
        return jobs;
    }
    if (json.is_object() && json.contains("jobs")) {
        const Json& list = json["jobs"];
        if (!list.is_array()) {
            throw std::runtime_error("'jobs' must be an array");
        }
        for (const auto& item : list.as_array()) {
            jobs.push_back(parseActionRequest(item));
        }
        return jobs;
    }
    jobs.push_back(parseActionRequest(json));
    return jobs;
}

Json outcomesToJson(const std::vector<ActionOutcome>& outcomes)
{
    Json list = Json::array();
    for (const auto& outcome : outcomes) {
        list.push_back(toJson(outcome));
    }
    return list;
}

BatchRunner::BatchRunner(ActionEnvironment env, DeviceFactory factory, std::size_t workers)
    : env_(std::move(env)), factory_(std::move(factory)), workers_(workers == 0 ? 1 : workers)
{
    if (!factory_) {
        throw std::invalid_argument("BatchRunner requires a device factory");
    }
    if (!env_.locator) {
        throw std::invalid_argument("BatchRunner requires a locator");
    }
}

std::vector<ActionOutcome> BatchRunner::run(const std::vector<ActionRequest>& jobs) const
{
    std::vector<ActionOutcome> outcomes(jobs.size());
    if (jobs.empty()) {
        return outcomes;
    }

    // Devices in order of first appearance.
    std::vector<std::pair<std::string, std::vector<std::size_t>>> queues;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        auto it = queues.begin();
        for (; it != queues.end(); ++it) {
            if (it->first == jobs[i].device) {
                break;
            }
        }
        if (it == queues.end()) {
            queues.emplace_back(jobs[i].device, std::vector<std::size_t>{});
            it = std::prev(queues.end());
        }
        it->second.push_back(i);
    }

    std::cerr << "[Batch] " << jobs.size() << " job(s) across " << queues.size()
              << " device(s), " << workers_ << " worker(s)" << std::endl;

    std::vector<std::future<void>> pending;
    {
        ThreadPool pool(std::min(workers_, queues.size()));
        pending.reserve(queues.size());
        for (const auto& queue : queues) {
            pending.push_back(pool.submit([this, &queue, &jobs, &outcomes] {
                runDeviceQueue(queue.first, queue.second, jobs, outcomes);
            }));
        }
    }
    for (auto& future : pending) {
        future.get();
    }
    return outcomes;
}

void BatchRunner::runDeviceQueue(const std::string& serial,
                                 const std::vector<std::size_t>& indices,
                                 const std::vector<ActionRequest>& jobs,
                                 std::vector<ActionOutcome>& outcomes) const
{
    std::unique_ptr<Device> device;
    std::string reason = "device factory returned no device";
    try {
        device = factory_(serial);
    } catch (const std::exception& ex) {
        reason = ex.what();
    }
    if (!device) {
        std::cerr << "[Batch] device '" << serial << "' unavailable: " << reason << std::endl;
        for (std::size_t index : indices) {
            outcomes[index] = unavailable(jobs[index], reason);
        }
        return;
    }

    for (std::size_t index : indices) {
        outcomes[index] = execute(*device, env_, jobs[index]);
    }
}

}  // namespace engage
