#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <cstddef>
#include <cstdint>

struct Config {
    // Correlation
    bool correlation_enabled = true;
    uint64_t temporal_window_secs = 300;
    double temporal_score_floor = 0.05;  // temporal score at the window edge
    double min_correlation_score = 0.5;
    size_t max_group_size = 100;
    double pattern_similarity_threshold = 0.7;
    double source_match_weight = 1.0;
    uint64_t source_decay_secs = 600;
    uint32_t topology_max_hops = 3;
    uint64_t topology_lookback_secs = 600;

    bool enable_temporal = true;
    bool enable_pattern = true;
    bool enable_source = true;
    bool enable_fingerprint = true;
    bool enable_topology = false;  // needs a topology provider

    // Per-strategy minimums; unset falls back to min_correlation_score
    std::optional<double> min_score_temporal;
    std::optional<double> min_score_pattern;
    std::optional<double> min_score_source;
    std::optional<double> min_score_fingerprint;
    std::optional<double> min_score_topology;

    // Grouping
    bool auto_merge_groups = true;
    double merge_threshold = 0.8;

    // Deduplication
    uint64_t dedup_window_secs = 900;

    // Candidate selection
    size_t max_candidates = 1000;
    bool same_source_candidates_only = false;

    // Maintenance
    uint64_t maintenance_interval_secs = 60;
    uint64_t stabilize_after_secs = 3600;
    uint64_t archive_after_secs = 604800;     // 7 days
    uint64_t retention_after_secs = 2592000;  // 30 days

    // Static topology edges (file only)
    std::vector<std::pair<std::string, std::string>> topology_edges;

    // Redis configuration
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string stream_incidents_in = "incidents.in";
    std::string stream_results_out = "correlator.results";
    std::string stream_req = "correlator.cmd.requests";
    std::string stream_rep = "correlator.cmd.replies";

    // Health check
    std::string health_host = "0.0.0.0";
    int health_port = 8085;

    // General
    std::string service_name = "correlator";
    std::string log_level = "info";
    int thread_pool_size = 4;

    // Load from environment variables
    void load_from_env();

    // Load from a JSON file; every key is optional
    void load_from_file(const std::string& path);

    // Throws InvalidConfigError on the first violated rule
    void validate() const;

    // Longest look-back any enabled strategy needs when selecting candidates
    uint64_t candidate_lookback_secs() const;
};
