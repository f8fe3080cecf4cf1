#pragma once

#include "config.hpp"
#include "correlation_ledger.hpp"
#include "deduplicator.hpp"
#include "fingerprint.hpp"
#include "group_manager.hpp"
#include "incident_store.hpp"
#include "maintenance.hpp"
#include "strategies.hpp"
#include "topology.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Owns the dedup index, the correlation ledger and the group index. One
// instance is shared by reference between the analysis workers and the
// maintenance scheduler.
class CorrelationEngine {
public:
    // Throws InvalidConfigError. topology may be null.
    CorrelationEngine(const Config& config, IncidentStore& store, TopologyProvider* topology = nullptr,
                      Clock clock = [] { return std::chrono::system_clock::now(); });
    ~CorrelationEngine();

    CorrelationEngine(const CorrelationEngine&) = delete;
    CorrelationEngine& operator=(const CorrelationEngine&) = delete;

    // Fingerprint, deduplicate, score against recent candidates, then group.
    // Store failures propagate to the caller.
    AnalysisResult analyze(Incident incident);

    std::optional<CorrelationGroupView> get_group(const std::string& incident_id) const;
    std::optional<CorrelationGroupView> get_group_by_id(const std::string& group_id) const;
    std::vector<CorrelationGroupSummary> list_groups(std::optional<GroupStatus> status = std::nullopt) const;

    // Links the incidents pairwise in the given order with score 1.0,
    // regardless of thresholds. Returns the first record. Throws
    // IncidentNotFoundError before touching any state, or CorrelationError
    // when fewer than two distinct incidents are given.
    CorrelationRecord manual_correlate(const std::vector<std::string>& incident_ids, const std::string& reason);

    // Throws GroupNotFoundError
    void resolve_group(const std::string& group_id);

    EngineStats get_stats() const;
    std::vector<CorrelationRecord> correlations_for(const std::string& incident_id) const;

    // Background maintenance
    void start();
    void stop();
    bool is_running() const;

    // Synchronous maintenance pass at the current clock time
    MaintenanceReport run_maintenance();

    const Config& config() const { return config_; }

private:
    void emit_records(const Incident& incident, const Incident& candidate, TimePoint now,
                      AnalysisResult& result);

    const Config config_;
    IncidentStore& store_;
    Clock clock_;

    FingerprintGenerator fingerprints_;
    StrategyEvaluator evaluator_;
    CorrelationLedger ledger_;
    Deduplicator dedup_;
    GroupManager groups_;
    MaintenanceScheduler scheduler_;
};
