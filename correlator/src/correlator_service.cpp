#include "correlator_service.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <optional>

using json = nlohmann::json;

CorrelatorService::CorrelatorService(const Config& config) : config_(config) {
    if (config_.enable_topology || !config_.topology_edges.empty()) {
        topology_ = std::make_unique<StaticTopologyProvider>(config_.topology_edges);
        spdlog::info("Loaded topology with {} resources", topology_->node_count());
    }

    engine_ = std::make_unique<CorrelationEngine>(config_, store_, topology_.get());
    redis_bus_ = std::make_unique<RedisBus>(config_);
    health_checker_ = std::make_unique<HealthChecker>(config_, [this] { return health_report(); });
}

CorrelatorService::~CorrelatorService() {
    stop();
}

void CorrelatorService::run() {
    if (running_) return;
    running_ = true;

    engine_->start();
    health_checker_->start();

    for (int i = 0; i < config_.thread_pool_size; ++i) {
        workers_.emplace_back(&CorrelatorService::worker_loop, this, i);
    }
    command_thread_ = std::thread(&CorrelatorService::command_loop, this);

    // Start Redis consumers
    redis_bus_->start_consumers(
        [this](const Incident& incident) {
            {
                std::lock_guard<std::mutex> lock(incident_queue_mutex_);
                incident_queue_.push(incident);
            }
            incident_queue_cv_.notify_one();
        },
        [this](const CommandRequest& req) {
            {
                std::lock_guard<std::mutex> lock(command_queue_mutex_);
                command_queue_.push(req);
            }
            command_queue_cv_.notify_one();
        }
    );

    spdlog::info("CorrelatorService started with {} workers.", config_.thread_pool_size);
}

void CorrelatorService::stop() {
    if (!running_) return;

    // Stop intake first so the workers can drain what is queued
    redis_bus_->stop();
    running_ = false;

    incident_queue_cv_.notify_all();
    command_queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    if (command_thread_.joinable()) {
        command_thread_.join();
    }

    engine_->stop();
    health_checker_->stop();
    spdlog::info("CorrelatorService stopped.");
}

void CorrelatorService::worker_loop(int worker_id) {
    spdlog::debug("Correlation worker {} started", worker_id);

    while (true) {
        Incident incident;
        {
            std::unique_lock<std::mutex> lock(incident_queue_mutex_);
            incident_queue_cv_.wait(lock, [this] { return !incident_queue_.empty() || !running_; });
            if (incident_queue_.empty()) {
                break;  // stopped and drained
            }
            incident = std::move(incident_queue_.front());
            incident_queue_.pop();
        }
        handle_incident(std::move(incident));
    }

    spdlog::debug("Correlation worker {} stopped", worker_id);
}

void CorrelatorService::command_loop() {
    const auto eviction_interval = std::chrono::seconds(config_.maintenance_interval_secs);
    auto next_eviction = std::chrono::steady_clock::now() + eviction_interval;

    while (running_) {
        std::optional<CommandRequest> request;
        {
            std::unique_lock<std::mutex> lock(command_queue_mutex_);
            command_queue_cv_.wait_for(lock, std::chrono::seconds(1), [this] {
                return !running_ || !command_queue_.empty();
            });
            if (!command_queue_.empty()) {
                request = std::move(command_queue_.front());
                command_queue_.pop();
            }
        }

        if (request) {
            handle_command_request(*request);
        }

        if (std::chrono::steady_clock::now() >= next_eviction) {
            next_eviction = std::chrono::steady_clock::now() + eviction_interval;
            auto cutoff = std::chrono::system_clock::now() - std::chrono::seconds(config_.retention_after_secs);
            size_t evicted = store_.evict_before(cutoff);
            if (evicted > 0) {
                spdlog::info("Evicted {} incidents past retention", evicted);
            }
        }
    }
}

void CorrelatorService::handle_incident(Incident incident) {
    try {
        if (incident.fingerprint.empty()) {
            incident.fingerprint = fingerprints_.fingerprint(incident);
        }

        // Visible as a candidate to concurrent analyses from the start
        store_.save(incident);

        AnalysisResult result = engine_->analyze(incident);
        if (result.dedup.is_duplicate()) {
            store_.remove(incident.id);
        }

        if (!redis_bus_->publish_result(result)) {
            spdlog::error("Failed to publish analysis result for incident {}", incident.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error analyzing incident {}: {}", incident.id, e.what());
    }
}

void CorrelatorService::handle_command_request(const CommandRequest& request) {
    spdlog::info("Processing command '{}' (corr_id {})", request.cmd, request.corr_id);

    CommandReply reply = execute_command(request);
    reply.corr_id = request.corr_id;
    reply.timestamp = std::chrono::system_clock::now();

    if (!redis_bus_->publish_command_reply(reply)) {
        spdlog::error("Failed to publish command reply for corr_id {}", reply.corr_id);
    }
}

CommandReply CorrelatorService::execute_command(const CommandRequest& request) {
    CommandReply reply;
    const json& args = request.args;

    try {
        if (request.cmd == "status") {
            reply.data = health_report();
            reply.ok = true;
            reply.message = fmt::format("Correlator status: {}", reply.data.value("status", "unknown"));
        } else if (request.cmd == "stats") {
            reply.data = engine_->get_stats().to_json();
            reply.ok = true;
            reply.message = "Engine statistics";
        } else if (request.cmd == "get_group") {
            if (args.contains("group_id")) {
                std::string group_id = args.at("group_id").get<std::string>();
                auto group = engine_->get_group_by_id(group_id);
                if (!group) {
                    throw GroupNotFoundError(group_id);
                }
                reply.data = group->to_json();
                reply.ok = true;
                reply.message = fmt::format("Group {} ({})", group_id, to_string(group->status));
            } else {
                std::string incident_id = args.at("incident_id").get<std::string>();
                auto group = engine_->get_group(incident_id);
                reply.ok = group.has_value();
                if (group) {
                    reply.data = group->to_json();
                    reply.message = fmt::format("Incident {} is in group {}", incident_id, group->id);
                } else {
                    reply.message = fmt::format("Incident {} is not in any group", incident_id);
                }
            }
        } else if (request.cmd == "list_groups") {
            std::optional<GroupStatus> status;
            if (args.contains("status") && args["status"].is_string()) {
                status = parse_group_status(args["status"].get<std::string>());
            }
            json groups = json::array();
            for (const auto& summary : engine_->list_groups(status)) {
                groups.push_back(summary.to_json());
            }
            reply.message = fmt::format("{} group(s)", groups.size());
            reply.data = std::move(groups);
            reply.ok = true;
        } else if (request.cmd == "manual_correlate") {
            auto ids = args.at("incident_ids").get<std::vector<std::string>>();
            auto record = engine_->manual_correlate(ids, args.value("reason", ""));
            reply.data = record.to_json();
            reply.ok = true;
            reply.message = fmt::format("Correlated {} incidents", ids.size());
        } else if (request.cmd == "resolve_group") {
            std::string group_id = args.at("group_id").get<std::string>();
            engine_->resolve_group(group_id);
            reply.ok = true;
            reply.message = fmt::format("Group {} resolved", group_id);
        } else if (request.cmd == "resolve_incident") {
            std::string incident_id = args.at("incident_id").get<std::string>();
            if (!store_.mark_resolved(incident_id, std::chrono::system_clock::now())) {
                throw IncidentNotFoundError(incident_id);
            }
            reply.ok = true;
            reply.message = fmt::format("Incident {} resolved", incident_id);
        } else {
            reply.message = fmt::format("Unknown command: {}", request.cmd);
        }
    } catch (const CorrelationError& e) {
        reply.ok = false;
        reply.message = e.what();
    } catch (const std::exception& e) {
        spdlog::warn("Bad arguments for command '{}': {}", request.cmd, e.what());
        reply.ok = false;
        reply.message = fmt::format("Invalid request: {}", e.what());
    }

    return reply;
}

json CorrelatorService::health_report() {
    bool redis_ok = redis_bus_->is_connected();
    bool scheduler_ok = engine_->is_running();

    return {
        {"status", redis_ok && scheduler_ok ? "ok" : "degraded"},
        {"service", config_.service_name},
        {"redis", redis_ok},
        {"scheduler_running", scheduler_ok},
        {"incidents", store_.size()},
        {"stats", engine_->get_stats().to_json()}
    };
}
