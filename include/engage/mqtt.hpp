#pragma once

#include <functional>
#include <memory>
#include <string>

#include "engage/config.hpp"
#include "engage/json.hpp"

namespace engage {

// Long-lived MQTT front end. Incoming payloads on the subscribe topic are
// handed to the processor; its return value is published on the response
// topic (or the topic the processor writes into `responseTopic`).
class MqttService {
public:
    using Processor = std::function<Json(const Json& payload, std::string& responseTopic)>;
    using StatusBuilder = std::function<Json()>;

    MqttService(AppConfig config, Processor processor, StatusBuilder status_builder = {});
    ~MqttService();

    MqttService(const MqttService&) = delete;
    MqttService& operator=(const MqttService&) = delete;

    // Blocks until stop() is called. Throws if the broker cannot be reached.
    void run();
    void stop();

    void publish(Json value, const std::string& topic = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Fills in the type, service and request metadata on a processor reply.
Json decorateResponse(Json response,
                      const std::string& service_name,
                      const std::string& client_id,
                      const std::string& request_id);

Json makeErrorPayload(const std::string& error,
                      const std::string& service_name,
                      const std::string& client_id,
                      const std::string& request_id);

}  // namespace engage
