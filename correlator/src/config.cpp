#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {
    std::string get_env(const char* name, const std::string& default_value) {
        const char* value = std::getenv(name);
        return value ? value : default_value;
    }

    int get_env_int(const char* name, int default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoi(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid integer value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    uint64_t get_env_u64(const char* name, uint64_t default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stoull(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid unsigned value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    double get_env_double(const char* name, double default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    bool get_env_bool(const char* name, bool default_value) {
        const char* value = std::getenv(name);
        if (!value) {
            return default_value;
        }
        std::string v = util::to_lower(value);
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
        spdlog::warn("Invalid boolean value for {}: {}", name, value);
        return default_value;
    }

    std::optional<double> get_env_optional_double(const char* name, std::optional<double> default_value) {
        const char* value = std::getenv(name);
        if (value) {
            try {
                return std::stod(value);
            } catch (const std::exception&) {
                spdlog::warn("Invalid double value for {}: {}", name, value);
            }
        }
        return default_value;
    }

    template <typename T>
    void read_json(const nlohmann::json& j, const char* key, T& target) {
        if (j.contains(key) && !j[key].is_null()) {
            target = j[key].get<T>();
        }
    }

    void read_json_optional(const nlohmann::json& j, const char* key, std::optional<double>& target) {
        if (j.contains(key) && !j[key].is_null()) {
            target = j[key].get<double>();
        }
    }

    void require_unit_interval(const char* name, double value) {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw InvalidConfigError(fmt::format("{} must be within [0, 1], got {}", name, value));
        }
    }
}

void Config::load_from_env() {
    // Correlation
    correlation_enabled = get_env_bool("CORRELATION_ENABLED", correlation_enabled);
    temporal_window_secs = get_env_u64("TEMPORAL_WINDOW_SECS", temporal_window_secs);
    temporal_score_floor = get_env_double("TEMPORAL_SCORE_FLOOR", temporal_score_floor);
    min_correlation_score = get_env_double("MIN_CORRELATION_SCORE", min_correlation_score);
    max_group_size = get_env_u64("MAX_GROUP_SIZE", max_group_size);
    pattern_similarity_threshold = get_env_double("PATTERN_SIMILARITY_THRESHOLD", pattern_similarity_threshold);
    source_match_weight = get_env_double("SOURCE_MATCH_WEIGHT", source_match_weight);
    source_decay_secs = get_env_u64("SOURCE_DECAY_SECS", source_decay_secs);
    topology_max_hops = static_cast<uint32_t>(get_env_u64("TOPOLOGY_MAX_HOPS", topology_max_hops));
    topology_lookback_secs = get_env_u64("TOPOLOGY_LOOKBACK_SECS", topology_lookback_secs);

    enable_temporal = get_env_bool("ENABLE_TEMPORAL", enable_temporal);
    enable_pattern = get_env_bool("ENABLE_PATTERN", enable_pattern);
    enable_source = get_env_bool("ENABLE_SOURCE", enable_source);
    enable_fingerprint = get_env_bool("ENABLE_FINGERPRINT", enable_fingerprint);
    enable_topology = get_env_bool("ENABLE_TOPOLOGY", enable_topology);

    min_score_temporal = get_env_optional_double("MIN_SCORE_TEMPORAL", min_score_temporal);
    min_score_pattern = get_env_optional_double("MIN_SCORE_PATTERN", min_score_pattern);
    min_score_source = get_env_optional_double("MIN_SCORE_SOURCE", min_score_source);
    min_score_fingerprint = get_env_optional_double("MIN_SCORE_FINGERPRINT", min_score_fingerprint);
    min_score_topology = get_env_optional_double("MIN_SCORE_TOPOLOGY", min_score_topology);

    // Grouping
    auto_merge_groups = get_env_bool("AUTO_MERGE_GROUPS", auto_merge_groups);
    merge_threshold = get_env_double("MERGE_THRESHOLD", merge_threshold);

    dedup_window_secs = get_env_u64("DEDUP_WINDOW_SECS", dedup_window_secs);

    max_candidates = get_env_u64("MAX_CANDIDATES", max_candidates);
    same_source_candidates_only = get_env_bool("SAME_SOURCE_CANDIDATES_ONLY", same_source_candidates_only);

    // Maintenance
    maintenance_interval_secs = get_env_u64("MAINTENANCE_INTERVAL_SECS", maintenance_interval_secs);
    stabilize_after_secs = get_env_u64("STABILIZE_AFTER_SECS", stabilize_after_secs);
    archive_after_secs = get_env_u64("ARCHIVE_AFTER_SECS", archive_after_secs);
    retention_after_secs = get_env_u64("RETENTION_AFTER_SECS", retention_after_secs);

    // Redis configuration
    redis_url = get_env("REDIS_URL", redis_url);
    stream_incidents_in = get_env("STREAM_INCIDENTS_IN", stream_incidents_in);
    stream_results_out = get_env("STREAM_RESULTS_OUT", stream_results_out);
    stream_req = get_env("STREAM_REQ", stream_req);
    stream_rep = get_env("STREAM_REP", stream_rep);

    // Health check
    health_host = get_env("HEALTH_HOST", health_host);
    health_port = get_env_int("HEALTH_PORT", health_port);

    // General
    service_name = get_env("SERVICE_NAME", service_name);
    log_level = get_env("LOG_LEVEL", log_level);
    thread_pool_size = get_env_int("THREAD_POOL_SIZE", thread_pool_size);
}

void Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidConfigError("cannot open config file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigError(fmt::format("malformed config file {}: {}", path, e.what()));
    }

    try {
        read_json(j, "correlation_enabled", correlation_enabled);
        read_json(j, "temporal_window_secs", temporal_window_secs);
        read_json(j, "temporal_score_floor", temporal_score_floor);
        read_json(j, "min_correlation_score", min_correlation_score);
        read_json(j, "max_group_size", max_group_size);
        read_json(j, "pattern_similarity_threshold", pattern_similarity_threshold);
        read_json(j, "source_match_weight", source_match_weight);
        read_json(j, "source_decay_secs", source_decay_secs);
        read_json(j, "topology_max_hops", topology_max_hops);
        read_json(j, "topology_lookback_secs", topology_lookback_secs);

        read_json(j, "enable_temporal", enable_temporal);
        read_json(j, "enable_pattern", enable_pattern);
        read_json(j, "enable_source", enable_source);
        read_json(j, "enable_fingerprint", enable_fingerprint);
        read_json(j, "enable_topology", enable_topology);

        read_json_optional(j, "min_score_temporal", min_score_temporal);
        read_json_optional(j, "min_score_pattern", min_score_pattern);
        read_json_optional(j, "min_score_source", min_score_source);
        read_json_optional(j, "min_score_fingerprint", min_score_fingerprint);
        read_json_optional(j, "min_score_topology", min_score_topology);

        read_json(j, "auto_merge_groups", auto_merge_groups);
        read_json(j, "merge_threshold", merge_threshold);
        read_json(j, "dedup_window_secs", dedup_window_secs);
        read_json(j, "max_candidates", max_candidates);
        read_json(j, "same_source_candidates_only", same_source_candidates_only);

        read_json(j, "maintenance_interval_secs", maintenance_interval_secs);
        read_json(j, "stabilize_after_secs", stabilize_after_secs);
        read_json(j, "archive_after_secs", archive_after_secs);
        read_json(j, "retention_after_secs", retention_after_secs);

        if (j.contains("topology_edges")) {
            topology_edges.clear();
            for (const auto& edge : j.at("topology_edges")) {
                topology_edges.emplace_back(edge.at(0).get<std::string>(), edge.at(1).get<std::string>());
            }
        }

        read_json(j, "redis_url", redis_url);
        read_json(j, "stream_incidents_in", stream_incidents_in);
        read_json(j, "stream_results_out", stream_results_out);
        read_json(j, "stream_req", stream_req);
        read_json(j, "stream_rep", stream_rep);
        read_json(j, "health_host", health_host);
        read_json(j, "health_port", health_port);
        read_json(j, "service_name", service_name);
        read_json(j, "log_level", log_level);
        read_json(j, "thread_pool_size", thread_pool_size);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfigError(fmt::format("bad value in config file {}: {}", path, e.what()));
    }
}

void Config::validate() const {
    require_unit_interval("min_correlation_score", min_correlation_score);
    require_unit_interval("pattern_similarity_threshold", pattern_similarity_threshold);
    require_unit_interval("merge_threshold", merge_threshold);
    require_unit_interval("source_match_weight", source_match_weight);

    const std::pair<const char*, const std::optional<double>*> minimums[] = {
        {"min_score_temporal", &min_score_temporal},
        {"min_score_pattern", &min_score_pattern},
        {"min_score_source", &min_score_source},
        {"min_score_fingerprint", &min_score_fingerprint},
        {"min_score_topology", &min_score_topology},
    };
    for (const auto& entry : minimums) {
        if (entry.second->has_value()) {
            require_unit_interval(entry.first, **entry.second);
        }
    }

    if (max_group_size == 0) {
        throw InvalidConfigError("max_group_size must be greater than 0");
    }
    if (max_group_size < 2) {
        throw InvalidConfigError("max_group_size must allow at least a pair of incidents");
    }

    if (temporal_window_secs == 0) {
        throw InvalidConfigError("temporal_window_secs must be greater than 0");
    }
    if (!(temporal_score_floor > 0.0 && temporal_score_floor < 1.0)) {
        throw InvalidConfigError(fmt::format("temporal_score_floor must be within (0, 1), got {}",
                                             temporal_score_floor));
    }
    if (source_decay_secs == 0) {
        throw InvalidConfigError("source_decay_secs must be greater than 0");
    }
    if (enable_topology && topology_max_hops == 0) {
        throw InvalidConfigError("topology_max_hops must be greater than 0");
    }

    if (dedup_window_secs == 0) {
        throw InvalidConfigError("dedup_window_secs must be greater than 0");
    }
    if (max_candidates == 0) {
        throw InvalidConfigError("max_candidates must be greater than 0");
    }
    if (maintenance_interval_secs == 0) {
        throw InvalidConfigError("maintenance_interval_secs must be greater than 0");
    }
    if (health_port < 1 || health_port > 65535) {
        throw InvalidConfigError("health_port must be between 1 and 65535");
    }
    if (thread_pool_size < 1 || thread_pool_size > 64) {
        throw InvalidConfigError("thread_pool_size must be between 1 and 64");
    }
}

uint64_t Config::candidate_lookback_secs() const {
    uint64_t lookback = temporal_window_secs;
    if (enable_topology) {
        lookback = std::max(lookback, topology_lookback_secs);
    }
    return lookback;
}
