#include "engine.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {
    const Config& validated(const Config& config) {
        config.validate();
        return config;
    }
}

CorrelationEngine::CorrelationEngine(const Config& config, IncidentStore& store, TopologyProvider* topology,
                                     Clock clock)
    : config_(validated(config)),
      store_(store),
      clock_(std::move(clock)),
      evaluator_(config_, topology),
      dedup_(config_, store),
      groups_(config_, ledger_),
      scheduler_(config_, groups_, ledger_, dedup_, store, clock_) {
    if (config_.enable_topology && !topology) {
        spdlog::warn("Topology strategy enabled without a topology provider; it will never signal");
    }
}

CorrelationEngine::~CorrelationEngine() {
    stop();
}

AnalysisResult CorrelationEngine::analyze(Incident incident) {
    auto started = std::chrono::steady_clock::now();
    TimePoint now = clock_();

    if (incident.fingerprint.empty()) {
        incident.fingerprint = fingerprints_.fingerprint(incident);
    }

    AnalysisResult result;
    result.incident_id = incident.id;
    result.dedup = dedup_.check_and_record(incident, now);

    if (result.dedup.is_duplicate()) {
        result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        spdlog::info("Incident {} deduplicated into {} (occurrence {})",
                     incident.id, result.dedup.existing_id, result.dedup.occurrences);
        return result;
    }

    if (config_.correlation_enabled) {
        IncidentFilter filter;
        filter.exclude_id = incident.id;
        filter.limit = config_.max_candidates;
        if (config_.same_source_candidates_only) {
            filter.source = incident.source;
        }

        auto since = incident.created_at - std::chrono::seconds(config_.candidate_lookback_secs());
        for (const auto& candidate : store_.list_recent(filter, since)) {
            emit_records(incident, candidate, now, result);
        }
    }

    result.group_id = groups_.group_of(incident.id);
    result.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    spdlog::info("Analyzed incident {}: {} correlation(s), group {}, {}ms",
                 incident.id, result.correlations.size(),
                 result.group_id.value_or("none"), result.processing_time_ms);
    return result;
}

void CorrelationEngine::emit_records(const Incident& incident, const Incident& candidate, TimePoint now,
                                     AnalysisResult& result) {
    StrategyScores scores = evaluator_.evaluate(incident, candidate);

    for (const auto& signal : scores.signals) {
        if (signal.score < evaluator_.minimum_score(signal.kind)) {
            continue;
        }
        auto record = CorrelationRecord::make(incident.id, candidate.id, signal.kind,
                                              signal.score, signal.reason, now);
        ledger_.add(record);
        result.correlations.push_back(std::move(record));
    }

    if (!scores.combined || scores.combined->score < config_.min_correlation_score) {
        return;
    }

    auto combined = CorrelationRecord::make(incident.id, candidate.id, StrategyKind::Combined,
                                            scores.combined->score, scores.combined->reason, now);
    result.mutations.push_back(groups_.ingest(combined, incident, candidate, now));
    result.correlations.push_back(std::move(combined));
}

std::optional<CorrelationGroupView> CorrelationEngine::get_group(const std::string& incident_id) const {
    return groups_.view_for_incident(incident_id);
}

std::optional<CorrelationGroupView> CorrelationEngine::get_group_by_id(const std::string& group_id) const {
    return groups_.view(group_id);
}

std::vector<CorrelationGroupSummary> CorrelationEngine::list_groups(std::optional<GroupStatus> status) const {
    return groups_.summaries(status);
}

CorrelationRecord CorrelationEngine::manual_correlate(const std::vector<std::string>& incident_ids,
                                                      const std::string& reason) {
    std::vector<std::string> distinct;
    for (const auto& id : incident_ids) {
        if (std::find(distinct.begin(), distinct.end(), id) == distinct.end()) {
            distinct.push_back(id);
        }
    }
    if (distinct.size() < 2) {
        throw CorrelationError("Manual correlation needs at least two distinct incidents");
    }

    // Resolve every ID before mutating anything
    std::vector<Incident> incidents;
    incidents.reserve(distinct.size());
    for (const auto& id : distinct) {
        auto incident = store_.get_incident(id);
        if (!incident) {
            throw IncidentNotFoundError(id);
        }
        incidents.push_back(std::move(*incident));
    }

    TimePoint now = clock_();
    std::string why = reason.empty() ? "Manually correlated" : reason;

    std::optional<CorrelationRecord> first;
    for (size_t i = 1; i < incidents.size(); ++i) {
        auto record = CorrelationRecord::make(incidents[i - 1].id, incidents[i].id,
                                              StrategyKind::Manual, 1.0, why, now);
        auto mutation = groups_.ingest(record, incidents[i - 1], incidents[i], now);
        if (!mutation.structural() && mutation.mutation != GroupMutation::Unchanged) {
            spdlog::warn("Manual correlation {} <-> {} recorded without regrouping: {}",
                         record.incident_a, record.incident_b, to_string(mutation.mutation));
        }
        if (!first) {
            first = record;
        }
    }

    spdlog::info("Manually correlated {} incidents", incidents.size());
    return *first;
}

void CorrelationEngine::resolve_group(const std::string& group_id) {
    groups_.resolve(group_id, clock_());
}

EngineStats CorrelationEngine::get_stats() const {
    EngineStats stats;
    groups_.fill_stats(stats);
    stats.total_correlations = ledger_.size();
    stats.dedup_entries = dedup_.size();
    return stats;
}

std::vector<CorrelationRecord> CorrelationEngine::correlations_for(const std::string& incident_id) const {
    return ledger_.for_incident(incident_id);
}

void CorrelationEngine::start() {
    scheduler_.start();
}

void CorrelationEngine::stop() {
    scheduler_.stop();
}

bool CorrelationEngine::is_running() const {
    return scheduler_.is_running();
}

MaintenanceReport CorrelationEngine::run_maintenance() {
    return scheduler_.tick(clock_());
}
