#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <iterator>
#include <unordered_map>
#include <unistd.h> // for getpid()

RedisBus::RedisBus(const Config& config) : config_(config) {
    if (!ensure_connection()) {
        spdlog::warn("Redis at {} is not reachable yet; consumers will keep retrying", config_.redis_url);
    }
}

RedisBus::~RedisBus() {
    stop();
}

bool RedisBus::ensure_connection() {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    try {
        if (redis_) {
            redis_->ping();
            return true;
        }
    } catch (const sw::redis::Error& e) {
        spdlog::warn("Redis ping failed, reconnecting: {}", e.what());
    }

    try {
        redis_ = std::make_shared<sw::redis::Redis>(config_.redis_url);
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        redis_.reset();
        return false;
    }
}

void RedisBus::start_consumers(
    std::function<void(const Incident&)> incident_callback,
    std::function<void(const CommandRequest&)> command_callback) {
    if (running_) return;
    running_ = true;

    incident_consumer_thread_ = std::thread([this, callback = std::move(incident_callback)]() {
        consumer_loop(config_.stream_incidents_in, config_.service_name + "_incidents_in",
                      [&callback](const nlohmann::json& j) { callback(Incident::from_json(j)); });
    });

    command_consumer_thread_ = std::thread([this, callback = std::move(command_callback)]() {
        consumer_loop(config_.stream_req, config_.service_name + "_commands",
                      [&callback](const nlohmann::json& j) { callback(CommandRequest::from_json(j)); });
    });
}

void RedisBus::stop() {
    if (!running_) return;
    running_ = false;
    if (incident_consumer_thread_.joinable()) {
        incident_consumer_thread_.join();
    }
    if (command_consumer_thread_.joinable()) {
        command_consumer_thread_.join();
    }
}

bool RedisBus::is_connected() {
    return ensure_connection();
}

void RedisBus::consumer_loop(const std::string& stream, const std::string& consumer_group,
                             const std::function<void(const nlohmann::json&)>& handle) {
    std::string consumer_name = config_.service_name + "_" + std::to_string(getpid());
    bool group_ready = false;

    while (running_) {
        try {
            if (!ensure_connection()) {
                std::this_thread::sleep_for(std::chrono::seconds(5));
                continue;
            }

            std::shared_ptr<sw::redis::Redis> redis;
            {
                std::lock_guard<std::mutex> lock(connection_mutex_);
                redis = redis_;
            }
            if (!redis) continue;

            if (!group_ready) {
                try {
                    redis->xgroup_create(stream, consumer_group, "0", true);
                } catch (const sw::redis::Error& e) {
                    spdlog::debug("xgroup_create on {}: {}", stream, e.what());  // BUSYGROUP when it exists
                }
                group_ready = true;
            }

            using Attrs = std::unordered_map<std::string, std::string>;
            using Item = std::pair<std::string, Attrs>;
            using ItemStream = std::vector<Item>;
            std::unordered_map<std::string, ItemStream> result;

            redis->xreadgroup(consumer_group, consumer_name, stream, ">",
                              std::chrono::milliseconds(1000), 10,
                              std::inserter(result, result.end()));

            for (const auto& entry : result) {
                for (const auto& msg : entry.second) {
                    try {
                        auto data_it = msg.second.find("data");
                        if (data_it != msg.second.end()) {
                            handle(nlohmann::json::parse(data_it->second));
                        } else {
                            spdlog::warn("Message {} on {} has no data field", msg.first, stream);
                        }
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to process message {} on {}: {}", msg.first, stream, e.what());
                    }
                    redis->xack(stream, consumer_group, msg.first);
                }
            }
        } catch (const sw::redis::TimeoutError&) {
            // Expected when the stream is idle
        } catch (const std::exception& e) {
            if (running_) {
                spdlog::error("Consumer error on {}: {}", stream, e.what());
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }
}

bool RedisBus::publish(const std::string& stream, const nlohmann::json& payload) {
    if (!ensure_connection()) return false;

    std::shared_ptr<sw::redis::Redis> redis;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        redis = redis_;
    }
    if (!redis) return false;

    try {
        std::unordered_map<std::string, std::string> fields = {{"data", payload.dump()}};
        redis->xadd(stream, "*", fields.begin(), fields.end());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
        return false;
    }
}

bool RedisBus::publish_result(const AnalysisResult& result) {
    return publish(config_.stream_results_out, result.to_json());
}

bool RedisBus::publish_command_reply(const CommandReply& reply) {
    return publish(config_.stream_rep, reply.to_json());
}
