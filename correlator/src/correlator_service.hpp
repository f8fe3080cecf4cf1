#pragma once

#include "config.hpp"
#include "engine.hpp"
#include "fingerprint.hpp"
#include "health.hpp"
#include "incident_store.hpp"
#include "redis_bus.hpp"
#include "topology.hpp"
#include "types.hpp"

#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <vector>

class CorrelatorService {
public:
    explicit CorrelatorService(const Config& config);
    ~CorrelatorService();

    void run();
    void stop();

private:
    // Worker loop draining the incident queue
    void worker_loop(int worker_id);

    // Command loop; also evicts incidents past retention
    void command_loop();

    // Message handlers
    void handle_incident(Incident incident);
    void handle_command_request(const CommandRequest& request);
    CommandReply execute_command(const CommandRequest& request);

    nlohmann::json health_report();

    Config config_;

    // Service components
    InMemoryIncidentStore store_;
    std::unique_ptr<StaticTopologyProvider> topology_;
    std::unique_ptr<CorrelationEngine> engine_;
    std::unique_ptr<RedisBus> redis_bus_;
    std::unique_ptr<HealthChecker> health_checker_;
    FingerprintGenerator fingerprints_;

    // Thread management
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::thread command_thread_;

    // Queues decoupling the Redis consumer threads from processing
    std::mutex incident_queue_mutex_;
    std::condition_variable incident_queue_cv_;
    std::queue<Incident> incident_queue_;

    std::mutex command_queue_mutex_;
    std::condition_variable command_queue_cv_;
    std::queue<CommandRequest> command_queue_;
};
