#include "engage/mqtt.hpp"
#include "engage/common.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <mosquitto.h>

namespace engage {

Json decorateResponse(Json response,
                      const std::string& service_name,
                      const std::string& client_id,
                      const std::string& request_id)
{
    if (!response.is_object()) {
        Json wrapper = Json::object();
        wrapper["results"] = std::move(response);
        response = std::move(wrapper);
    }
    if (!response.contains("type")) {
        response["type"] = "action_result";
    }
    response["service_name"] = service_name;
    response["client_id"] = client_id;
    if (!request_id.empty()) {
        response["request_id"] = request_id;
    }
    return response;
}

Json makeErrorPayload(const std::string& error,
                      const std::string& service_name,
                      const std::string& client_id,
                      const std::string& request_id)
{
    Json payload = Json::object();
    payload["type"] = "action_error";
    payload["service_name"] = service_name;
    payload["client_id"] = client_id;
    payload["timestamp"] = currentIsoTimestamp();
    payload["error"] = error;
    if (!request_id.empty()) {
        payload["request_id"] = request_id;
    }
    return payload;
}

struct MqttService::Impl {
    Impl(AppConfig cfg, Processor proc, StatusBuilder status)
        : config(std::move(cfg)), processor(std::move(proc)), status_builder(std::move(status))
    {
        if (!processor) {
            throw std::invalid_argument("MQTT processor callback must not be empty");
        }
        mosquitto_lib_init();
        const char* client_id = config.mqtt.client_id.empty() ? nullptr : config.mqtt.client_id.c_str();

        client.reset(mosquitto_new(client_id, true, this));
        if (!client) {
            mosquitto_lib_cleanup();
            throw std::runtime_error("Failed to create MQTT client");
        }

        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_disconnect_callback_set(client.get(), &Impl::onDisconnect);
        mosquitto_message_callback_set(client.get(), &Impl::onMessage);
        mosquitto_reconnect_delay_set(client.get(), 1, 8, true);

        if (!config.mqtt.username.empty()) {
            const char* password = config.mqtt.password.empty() ? nullptr : config.mqtt.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), config.mqtt.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                mosquitto_destroy(client.release());
                mosquitto_lib_cleanup();
                throw std::runtime_error(std::string("Failed to set MQTT credentials: ") + mosquitto_strerror(rc));
            }
        } else if (!config.mqtt.password.empty()) {
            mosquitto_destroy(client.release());
            mosquitto_lib_cleanup();
            throw std::runtime_error("MQTT password provided without username");
        }

        publish_topic = config.mqtt.publish_topic;
        if (publish_topic.empty()) {
            publish_topic = config.mqtt.subscribe_topic + "/response";
        }
    }

    ~Impl()
    {
        if (heartbeat_thread.joinable()) {
            stop_requested.store(true);
            heartbeat_thread.join();
        }
        if (client) {
            mosquitto_destroy(client.release());
        }
        mosquitto_lib_cleanup();
    }

    void run()
    {
        stop_requested.store(false);
        const std::string& server = config.mqtt.server;
        if (server.empty()) {
            throw std::runtime_error("MQTT server address is empty");
        }
        int port = config.mqtt.port > 0 ? config.mqtt.port : 1883;
        int rc = mosquitto_connect(client.get(), server.c_str(), port, 60);
        if (rc != MOSQ_ERR_SUCCESS) {
            throw std::runtime_error(std::string("Failed to connect to MQTT broker: ") + mosquitto_strerror(rc));
        }
        std::cerr << "[MQTT] connected to " << server << ":" << port << std::endl;

        std::string topic = config.mqtt.heartbeat_topic.empty() ? "engage/heartbeat" : config.mqtt.heartbeat_topic;
        int interval = config.mqtt.heartbeat_time <= 0 ? 10 : config.mqtt.heartbeat_time;

        heartbeat_thread = std::thread([this, topic, interval]() {
            while (!stop_requested.load()) {
                Json heartbeat = Json::object();
                heartbeat["type"] = "heartbeat";
                heartbeat["timestamp"] = currentIsoTimestamp();
                heartbeat["service_name"] = config.service.name;
                heartbeat["client_id"] = config.mqtt.client_id;
                heartbeat["version"] = config.version;
                publishJson(heartbeat, topic);

                for (int i = 0; i < interval && !stop_requested.load(); ++i) {
                    std::this_thread::sleep_for(std::chrono::seconds(1));
                }
            }
        });

        while (!stop_requested.load()) {
            rc = mosquitto_loop(client.get(), 1000, 1);
            if (stop_requested.load()) {
                break;
            }
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] loop warning: " << mosquitto_strerror(rc) << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
                int reconnect = mosquitto_reconnect(client.get());
                if (reconnect != MOSQ_ERR_SUCCESS) {
                    std::cerr << "[MQTT] reconnect failed: " << mosquitto_strerror(reconnect) << std::endl;
                }
            }
        }

        if (heartbeat_thread.joinable()) {
            heartbeat_thread.join();
        }
    }

    void stop()
    {
        if (!stop_requested.exchange(true)) {
            publishStatus("offline");
        }
        mosquitto_disconnect(client.get());
    }

    void publishJson(const Json& value, const std::string& topic_override = {})
    {
        std::lock_guard<std::mutex> lock(publish_mutex);
        const std::string& topic = topic_override.empty() ? publish_topic : topic_override;
        std::string payload = value.dump();
        int rc = mosquitto_publish(client.get(), nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), 1, false);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] publish to " << topic << " failed: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    void publishStatus(const std::string& state)
    {
        Json payload = status_builder ? status_builder() : Json::object();
        if (!payload.is_object()) {
            payload = Json::object();
        }
        payload["type"] = "service_registration";
        payload["state"] = state;
        payload["service_name"] = config.service.name;
        payload["client_id"] = config.mqtt.client_id;
        publishJson(payload);
    }

    void handleMessage(const mosquitto_message* message)
    {
        if (!message || !message->payload || message->payloadlen <= 0) {
            return;
        }
        std::string payload(static_cast<const char*>(message->payload), static_cast<std::size_t>(message->payloadlen));
        std::string response_topic;
        std::string request_id;

        try {
            Json json = Json::parse(payload);
            if (json.is_object() && json.contains("request_id") && json["request_id"].is_string()) {
                request_id = json["request_id"].as_string();
            }
            Json response = processor(json, response_topic);
            publishJson(decorateResponse(std::move(response), config.service.name, config.mqtt.client_id, request_id),
                        response_topic);
        } catch (const std::exception& ex) {
            std::cerr << "[MQTT] request rejected: " << ex.what() << std::endl;
            publishJson(makeErrorPayload(ex.what(), config.service.name, config.mqtt.client_id, request_id),
                        response_topic);
        }
    }

    static void onConnect(struct mosquitto* mosq, void* userdata, int rc)
    {
        auto* self = static_cast<Impl*>(userdata);
        if (!self) {
            return;
        }
        if (rc != 0) {
            std::cerr << "[MQTT] connect refused: " << mosquitto_connack_string(rc) << std::endl;
            return;
        }
        self->publishStatus("online");
        if (!self->config.mqtt.subscribe_topic.empty()) {
            mosquitto_subscribe(mosq, nullptr, self->config.mqtt.subscribe_topic.c_str(), 1);
            std::cerr << "[MQTT] subscribed to " << self->config.mqtt.subscribe_topic << std::endl;
        }
    }

    static void onDisconnect(struct mosquitto* mosq, void* userdata, int rc)
    {
        (void)mosq;
        if (rc != 0 && userdata) {
            std::cerr << "[MQTT] unexpected disconnect: " << mosquitto_strerror(rc) << std::endl;
        }
    }

    static void onMessage(struct mosquitto* mosq, void* userdata, const mosquitto_message* message)
    {
        (void)mosq;
        auto* self = static_cast<Impl*>(userdata);
        if (self) {
            self->handleMessage(message);
        }
    }

    AppConfig config;
    Processor processor;
    StatusBuilder status_builder;
    std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client{nullptr, mosquitto_destroy};
    std::atomic<bool> stop_requested{false};
    std::mutex publish_mutex;
    std::string publish_topic;
    std::thread heartbeat_thread;
};

MqttService::MqttService(AppConfig config, Processor processor, StatusBuilder status_builder)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(processor), std::move(status_builder))) {}

MqttService::~MqttService() = default;

void MqttService::run()
{
    impl_->run();
}

void MqttService::stop()
{
    impl_->stop();
}

void MqttService::publish(Json value, const std::string& topic)
{
    impl_->publishJson(value, topic);
}

}  // namespace engage
