#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "engage/actions.hpp"

namespace engage {

// Opens the control channel for a device serial. May throw or return null
// when the device cannot be reached.
using DeviceFactory = std::function<std::unique_ptr<Device>(const std::string& serial)>;

// Accepts a bare job object, an array of jobs, or {"jobs": [...]}.
std::vector<ActionRequest> parseJobList(const Json& json);

Json outcomesToJson(const std::vector<ActionOutcome>& outcomes);

// Runs jobs for many devices at once. Jobs that share a device run one
// after another in submission order; distinct devices run in parallel.
class BatchRunner {
public:
    BatchRunner(ActionEnvironment env, DeviceFactory factory, std::size_t workers);

    // Outcomes come back in the order of `jobs`.
    std::vector<ActionOutcome> run(const std::vector<ActionRequest>& jobs) const;

private:
    void runDeviceQueue(const std::string& serial,
                        const std::vector<std::size_t>& indices,
                        const std::vector<ActionRequest>& jobs,
                        std::vector<ActionOutcome>& outcomes) const;

    ActionEnvironment env_;
    DeviceFactory factory_;
    std::size_t workers_;
};

}  // namespace engage
