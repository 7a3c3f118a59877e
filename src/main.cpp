#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "engage/actions.hpp"
#include "engage/adb_device.hpp"
#include "engage/batch.hpp"
#include "engage/commenter.hpp"
#include "engage/config.hpp"
#include "engage/locator.hpp"
#include "engage/mqtt.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void signalHandler(int signal) {
    gSignalStatus = signal;
}

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable << " [--config <path>] [--compact] <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  like    --device <serial> --url <post url>\n"
              << "  comment --device <serial> --url <post url> [--persona <text>]\n"
              << "  retweet --device <serial> --url <post url>\n"
              << "  follow  --device <serial> --user <username>\n"
              << "  locate  --frame <image> --template <name> [--policy topmost|highest_confidence]\n"
              << "  batch   [--jobs <file>]   (reads the job list from STDIN when omitted)\n"
              << "  --service                 run as an MQTT job service\n"
              << "\n"
              << "Outcomes are written to STDOUT as JSON; diagnostics go to STDERR." << std::endl;
}

std::string readStream(std::istream& stream) {
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

std::string require(const std::map<std::string, std::string>& options, const std::string& key) {
    auto it = options.find(key);
    if (it == options.end() || it->second.empty()) {
        throw std::runtime_error("Missing required option --" + key);
    }
    return it->second;
}

std::string optionValue(const std::map<std::string, std::string>& options, const std::string& key) {
    auto it = options.find(key);
    return it == options.end() ? std::string() : it->second;
}

// Shared state every command needs once the configuration is loaded.
struct Runtime {
    explicit Runtime(engage::AppConfig cfg)
        : config(std::move(cfg)),
          locator(engage::TemplateLibrary::loadManifest(config.locator.templates),
                  engage::LocatorOptions{config.locator.dedup_radius, config.locator.grayscale}) {
        if (!config.commenter.command.empty()) {
            commenter = std::make_unique<engage::CommandCommenter>(config.commenter.command);
        }
    }

    engage::ActionEnvironment environment() const {
        return engage::makeEnvironment(config, locator, commenter.get());
    }

    engage::DeviceFactory deviceFactory() const {
        engage::DeviceProfile profile = config.device;
        return [profile](const std::string& serial) -> std::unique_ptr<engage::Device> {
            return std::make_unique<engage::AdbDevice>(serial, profile);
        };
    }

    engage::AppConfig config;
    engage::TemplateLocator locator;
    std::unique_ptr<engage::CommandCommenter> commenter;
};

struct PendingBatch {
    std::string request_id;
    std::string response_topic;
    std::vector<engage::ActionRequest> jobs;
};

int runService(Runtime& runtime) {
    const engage::AppConfig& config = runtime.config;
    engage::BatchRunner runner(runtime.environment(), runtime.deviceFactory(),
                               static_cast<std::size_t>(config.thread_pool_size));

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<PendingBatch> queue;
    std::atomic<bool> worker_stop{false};

    auto processor = [&](const engage::Json& payload, std::string& responseTopic) {
        PendingBatch batch;
        if (payload.is_object()) {
            batch.request_id = payload.get_string("request_id", "");
            responseTopic = payload.get_string("response_topic", "");
        }
        batch.response_topic = responseTopic;
        batch.jobs = engage::parseJobList(payload);

        engage::Json ack = engage::Json::object();
        ack["type"] = "action_accepted";
        ack["timestamp"] = engage::currentIsoTimestamp();
        ack["job_count"] = static_cast<int>(batch.jobs.size());
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            queue.push_back(std::move(batch));
        }
        queue_cv.notify_one();
        return ack;
    };

    auto statusBuilder = [&config]() {
        return engage::configSnapshot(config);
    };

    engage::MqttService service(config, processor, statusBuilder);

    std::thread workerThread([&]() {
        while (true) {
            PendingBatch batch;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [&]() { return worker_stop.load() || !queue.empty(); });
                if (worker_stop.load() && queue.empty()) {
                    break;
                }
                batch = std::move(queue.front());
                queue.pop_front();
            }

            engage::Json message;
            try {
                auto outcomes = runner.run(batch.jobs);
                message = engage::Json::object();
                message["type"] = "action_result";
                message["timestamp"] = engage::currentIsoTimestamp();
                message["results"] = engage::outcomesToJson(outcomes);
                message = engage::decorateResponse(std::move(message), config.service.name,
                                                   config.mqtt.client_id, batch.request_id);
            } catch (const std::exception& ex) {
                std::cerr << "[Service] batch failed: " << ex.what() << std::endl;
                message = engage::makeErrorPayload(ex.what(), config.service.name,
                                                   config.mqtt.client_id, batch.request_id);
            }
            service.publish(message, batch.response_topic);
        }
    });

    std::promise<void> runPromise;
    std::future<void> runFuture = runPromise.get_future();
    std::thread mqttThread([&service, &runPromise]() {
        try {
            service.run();
            runPromise.set_value();
        } catch (...) {
            runPromise.set_exception(std::current_exception());
        }
    });

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    while (runFuture.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout) {
        if (gSignalStatus != 0) {
            service.stop();
        }
    }

    worker_stop.store(true);
    queue_cv.notify_all();
    workerThread.join();
    mqttThread.join();
    runFuture.get();
    return 0;
}

engage::ActionRequest requestFromOptions(engage::ActionKind kind,
                                         const std::map<std::string, std::string>& options) {
    engage::ActionRequest request;
    request.kind = kind;
    request.device = optionValue(options, "device");
    request.persona = optionValue(options, "persona");
    request.target = kind == engage::ActionKind::Follow ? require(options, "user") : require(options, "url");
    return request;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "engage.config.json";
    bool prettyPrint = true;
    std::string command;
    std::map<std::string, std::string> options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--compact") {
            prettyPrint = false;
        } else if (arg == "--service") {
            command = "service";
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg.rfind("--", 0) == 0 && i + 1 < argc) {
            options[arg.substr(2)] = argv[++i];
        } else if (command.empty() && arg.rfind("--", 0) != 0) {
            command = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        engage::AppConfig config = engage::loadConfig(configPath);
        const int indent = prettyPrint ? 2 : -1;

        if (command == "locate") {
            engage::TemplateLibrary library = engage::TemplateLibrary::loadManifest(config.locator.templates);
            engage::TemplateLocator locator(std::move(library),
                                            engage::LocatorOptions{config.locator.dedup_radius,
                                                                   config.locator.grayscale});
            std::string policyName = optionValue(options, "policy");
            engage::SelectionPolicy policy = engage::SelectionPolicy::Topmost;
            if (policyName == "highest_confidence") {
                policy = engage::SelectionPolicy::HighestConfidence;
            } else if (!policyName.empty() && policyName != "topmost") {
                throw std::runtime_error("Unknown policy: " + policyName);
            }
            cv::Mat frame = engage::loadImageFile(require(options, "frame"));
            engage::LocateResult result = locator.locate(frame, require(options, "template"), policy);
            std::cout << engage::toJson(result).dump(indent) << std::endl;
            return result.found ? 0 : 2;
        }

        Runtime runtime(std::move(config));

        if (command == "service") {
            return runService(runtime);
        }

        if (command == "batch") {
            std::string jobsPath = optionValue(options, "jobs");
            std::string data;
            if (jobsPath.empty() || jobsPath == "-") {
                data = readStream(std::cin);
            } else {
                std::ifstream jobsFile(jobsPath);
                if (!jobsFile) {
                    std::cerr << "Failed to open job file: " << jobsPath << std::endl;
                    return 1;
                }
                data = readStream(jobsFile);
            }
            auto jobs = engage::parseJobList(engage::Json::parse(data));
            engage::BatchRunner runner(runtime.environment(), runtime.deviceFactory(),
                                       static_cast<std::size_t>(runtime.config.thread_pool_size));
            auto outcomes = runner.run(jobs);

            engage::Json output = engage::Json::object();
            output["service_name"] = runtime.config.service.name;
            output["timestamp"] = engage::currentIsoTimestamp();
            output["results"] = engage::outcomesToJson(outcomes);
            std::cout << output.dump(indent) << std::endl;
            return 0;
        }

        auto kind = engage::parseActionKind(command);
        if (!kind) {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return 1;
        }

        engage::ActionRequest request = requestFromOptions(*kind, options);
        engage::AdbDevice device(request.device, runtime.config.device);
        engage::ActionOutcome outcome = engage::execute(device, runtime.environment(), request);
        std::cout << engage::toJson(outcome).dump(indent) << std::endl;
        return outcome.success ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
