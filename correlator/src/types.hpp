#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

// Injectable time source; tests drive it by hand
using Clock = std::function<TimePoint()>;

// Ordered: P0 is the most urgent
enum class Severity {
    P0 = 0,
    P1,
    P2,
    P3,
    P4
};

std::string to_string(Severity severity);
Severity parse_severity(const std::string& value);

struct Resource {
    std::string type;
    std::string id;
};

// Owned by the incident store; the engine only reads it.
struct Incident {
    std::string id;
    std::string fingerprint;
    std::string title;
    std::string description;
    Severity severity = Severity::P2;
    std::string category;
    std::string source;
    Resource resource;
    TimePoint created_at;
    std::optional<TimePoint> resolved_at;

    bool is_resolved() const { return resolved_at.has_value(); }

    static Incident from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class StrategyKind {
    Temporal,
    Pattern,
    Source,
    Fingerprint,
    Topology,
    Combined,
    Manual
};

std::string to_string(StrategyKind kind);
StrategyKind parse_strategy_kind(const std::string& value);

// Evidence that two incidents are related. Immutable once created.
struct CorrelationRecord {
    std::string id;
    std::string incident_a;  // incident_a < incident_b
    std::string incident_b;
    StrategyKind strategy = StrategyKind::Combined;
    double score = 0.0;
    std::string reason;
    TimePoint detected_at;

    // Builds a record with a fresh ID and canonical pair ordering
    static CorrelationRecord make(const std::string& first, const std::string& second,
                                  StrategyKind strategy, double score,
                                  const std::string& reason, TimePoint detected_at);

    bool involves(const std::string& incident_id) const {
        return incident_a == incident_id || incident_b == incident_id;
    }

    static CorrelationRecord from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class GroupStatus {
    Active,
    Stable,
    Resolved,
    Archived
};

std::string to_string(GroupStatus status);
GroupStatus parse_group_status(const std::string& value);

using IncidentPair = std::pair<std::string, std::string>;

struct CorrelationGroup {
    std::string id;
    std::string title;
    std::string primary_incident_id;
    std::map<std::string, TimePoint> members;    // incident id -> created_at
    std::map<IncidentPair, double> pair_scores;  // latest intra-group score per pair
    GroupStatus status = GroupStatus::Active;
    double aggregate_score = 0.0;
    TimePoint created_at;
    TimePoint updated_at;
    TimePoint last_member_added_at;
    std::optional<TimePoint> archived_at;

    bool contains(const std::string& incident_id) const {
        return members.count(incident_id) > 0;
    }
    size_t size() const { return members.size(); }

    void record_pair_score(const std::string& a, const std::string& b, double score);
    void recalculate_aggregate_score();
};

// Read-only snapshot of a group handed to consumers
struct CorrelationGroupView {
    std::string id;
    std::string title;
    std::string primary_incident_id;
    std::vector<std::string> members;
    GroupStatus status = GroupStatus::Active;
    double aggregate_score = 0.0;
    size_t correlation_count = 0;
    TimePoint created_at;
    TimePoint updated_at;

    static CorrelationGroupView from_group(const CorrelationGroup& group);
    nlohmann::json to_json() const;
};

struct CorrelationGroupSummary {
    std::string id;
    std::string title;
    std::string primary_incident_id;
    size_t size = 0;
    GroupStatus status = GroupStatus::Active;
    double aggregate_score = 0.0;
    TimePoint updated_at;

    static CorrelationGroupSummary from_group(const CorrelationGroup& group);
    nlohmann::json to_json() const;
};

enum class DedupOutcome {
    New,
    Duplicate
};

struct DedupResult {
    DedupOutcome outcome = DedupOutcome::New;
    std::string existing_id;  // set when outcome is Duplicate
    uint64_t occurrences = 0; // duplicate submissions seen for existing_id

    bool is_duplicate() const { return outcome == DedupOutcome::Duplicate; }

    nlohmann::json to_json() const;
};

// Timeline entry appended to an existing incident when a duplicate arrives
struct OccurrenceEvent {
    std::string incident_id;
    std::string duplicate_id;
    std::string fingerprint;
    std::string source;
    uint64_t occurrence;
    TimePoint occurred_at;
};

enum class GroupMutation {
    Created,
    MemberAdded,
    Merged,
    Unchanged,
    GroupFull,
    MergeRejected,
    GroupClosed
};

std::string to_string(GroupMutation mutation);

struct GroupMutationResult {
    GroupMutation mutation = GroupMutation::Unchanged;
    std::string group_id;           // group holding the pair afterwards, if any
    std::string absorbed_group_id;  // set on Merged

    bool structural() const {
        return mutation == GroupMutation::Created ||
               mutation == GroupMutation::MemberAdded ||
               mutation == GroupMutation::Merged;
    }
};

struct AnalysisResult {
    std::string incident_id;
    DedupResult dedup;
    std::vector<CorrelationRecord> correlations;
    std::optional<std::string> group_id;
    std::vector<GroupMutationResult> mutations;
    int64_t processing_time_ms = 0;

    nlohmann::json to_json() const;
};

struct EngineStats {
    size_t total_groups = 0;
    size_t active = 0;
    size_t stable = 0;
    size_t resolved = 0;
    size_t archived = 0;
    size_t total_correlations = 0;
    size_t mapped_incidents = 0;
    size_t dedup_entries = 0;

    nlohmann::json to_json() const;
};

// Command bus messages
struct CommandRequest {
    std::string cmd;
    nlohmann::json args;
    std::string corr_id;
    TimePoint timestamp;

    static CommandRequest from_json(const nlohmann::json& j);
};

struct CommandReply {
    std::string corr_id;
    bool ok = false;
    std::string message;
    nlohmann::json data;
    TimePoint timestamp;

    nlohmann::json to_json() const;
};
