#pragma once

#include "config.hpp"
#include "types.hpp"
#include <sw/redis++/redis++.h>
#include <functional>
#include <thread>
#include <atomic>
#include <memory>
#include <mutex>

// Stream transport for the daemon: incidents and command requests in,
// analysis results and command replies out. Each message carries its JSON
// payload in the "data" field.
class RedisBus {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus();

    void start_consumers(
        std::function<void(const Incident&)> incident_callback,
        std::function<void(const CommandRequest&)> command_callback
    );
    void stop();

    bool publish_result(const AnalysisResult& result);
    bool publish_command_reply(const CommandReply& reply);

    bool is_connected();

private:
    // Shared loop for both input streams; `handle` parses and dispatches one payload
    void consumer_loop(const std::string& stream, const std::string& consumer_group,
                       const std::function<void(const nlohmann::json&)>& handle);
    bool publish(const std::string& stream, const nlohmann::json& payload);
    bool ensure_connection();

    Config config_;
    std::mutex connection_mutex_;
    std::shared_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_{false};

    std::thread incident_consumer_thread_;
    std::thread command_consumer_thread_;
};
