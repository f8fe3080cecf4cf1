#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::P0: return "p0";
        case Severity::P1: return "p1";
        case Severity::P2: return "p2";
        case Severity::P3: return "p3";
        case Severity::P4: return "p4";
    }
    return "p2";
}

Severity parse_severity(const std::string& value) {
    std::string v = util::to_lower(value);
    if (v == "p0") return Severity::P0;
    if (v == "p1") return Severity::P1;
    if (v == "p2") return Severity::P2;
    if (v == "p3") return Severity::P3;
    if (v == "p4") return Severity::P4;
    throw std::invalid_argument("Unknown severity: " + value);
}

std::string to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Temporal: return "temporal";
        case StrategyKind::Pattern: return "pattern";
        case StrategyKind::Source: return "source";
        case StrategyKind::Fingerprint: return "fingerprint";
        case StrategyKind::Topology: return "topology";
        case StrategyKind::Combined: return "combined";
        case StrategyKind::Manual: return "manual";
    }
    return "combined";
}

StrategyKind parse_strategy_kind(const std::string& value) {
    std::string v = util::to_lower(value);
    if (v == "temporal") return StrategyKind::Temporal;
    if (v == "pattern") return StrategyKind::Pattern;
    if (v == "source") return StrategyKind::Source;
    if (v == "fingerprint") return StrategyKind::Fingerprint;
    if (v == "topology") return StrategyKind::Topology;
    if (v == "combined") return StrategyKind::Combined;
    if (v == "manual") return StrategyKind::Manual;
    throw std::invalid_argument("Unknown correlation strategy: " + value);
}

std::string to_string(GroupStatus status) {
    switch (status) {
        case GroupStatus::Active: return "active";
        case GroupStatus::Stable: return "stable";
        case GroupStatus::Resolved: return "resolved";
        case GroupStatus::Archived: return "archived";
    }
    return "active";
}

GroupStatus parse_group_status(const std::string& value) {
    std::string v = util::to_lower(value);
    if (v == "active") return GroupStatus::Active;
    if (v == "stable") return GroupStatus::Stable;
    if (v == "resolved") return GroupStatus::Resolved;
    if (v == "archived") return GroupStatus::Archived;
    throw std::invalid_argument("Unknown group status: " + value);
}

std::string to_string(GroupMutation mutation) {
    switch (mutation) {
        case GroupMutation::Created: return "created";
        case GroupMutation::MemberAdded: return "member_added";
        case GroupMutation::Merged: return "merged";
        case GroupMutation::Unchanged: return "unchanged";
        case GroupMutation::GroupFull: return "group_full";
        case GroupMutation::MergeRejected: return "merge_rejected";
        case GroupMutation::GroupClosed: return "group_closed";
    }
    return "unchanged";
}

Incident Incident::from_json(const nlohmann::json& j) {
    Incident incident;
    incident.id = j.at("id").get<std::string>();
    incident.fingerprint = j.value("fingerprint", "");
    incident.title = j.at("title").get<std::string>();
    incident.description = j.value("description", "");
    incident.severity = parse_severity(j.value("severity", "p2"));
    incident.category = j.value("category", "");
    incident.source = j.at("source").get<std::string>();
    if (j.contains("resource") && j["resource"].is_object()) {
        incident.resource.type = j["resource"].value("type", "");
        incident.resource.id = j["resource"].value("id", "");
    }
    incident.created_at = util::parse_iso8601(j.at("created_at").get<std::string>());
    if (j.contains("resolved_at") && j["resolved_at"].is_string()) {
        incident.resolved_at = util::parse_iso8601(j["resolved_at"].get<std::string>());
    }
    return incident;
}

nlohmann::json Incident::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"fingerprint", fingerprint},
        {"title", title},
        {"description", description},
        {"severity", to_string(severity)},
        {"category", category},
        {"source", source},
        {"resource", {{"type", resource.type}, {"id", resource.id}}},
        {"created_at", util::format_iso8601(created_at)},
        {"resolved_at", nullptr}
    };
    if (resolved_at) {
        j["resolved_at"] = util::format_iso8601(*resolved_at);
    }
    return j;
}

CorrelationRecord CorrelationRecord::make(const std::string& first, const std::string& second,
                                          StrategyKind strategy, double score,
                                          const std::string& reason, TimePoint detected_at) {
    CorrelationRecord record;
    record.id = util::generate_uuid();
    record.incident_a = first < second ? first : second;
    record.incident_b = first < second ? second : first;
    record.strategy = strategy;
    record.score = score;
    record.reason = reason;
    record.detected_at = detected_at;
    return record;
}

CorrelationRecord CorrelationRecord::from_json(const nlohmann::json& j) {
    CorrelationRecord record;
    record.id = j.at("id").get<std::string>();
    record.incident_a = j.at("incident_a").get<std::string>();
    record.incident_b = j.at("incident_b").get<std::string>();
    record.strategy = parse_strategy_kind(j.at("strategy").get<std::string>());
    record.score = j.at("score").get<double>();
    record.reason = j.value("reason", "");
    record.detected_at = util::parse_iso8601(j.at("detected_at").get<std::string>());
    return record;
}

nlohmann::json CorrelationRecord::to_json() const {
    return {
        {"id", id},
        {"incident_a", incident_a},
        {"incident_b", incident_b},
        {"strategy", to_string(strategy)},
        {"score", score},
        {"reason", reason},
        {"detected_at", util::format_iso8601(detected_at)}
    };
}

void CorrelationGroup::record_pair_score(const std::string& a, const std::string& b, double score) {
    IncidentPair key = a < b ? IncidentPair{a, b} : IncidentPair{b, a};
    pair_scores[key] = score;
    recalculate_aggregate_score();
}

void CorrelationGroup::recalculate_aggregate_score() {
    if (pair_scores.empty()) {
        aggregate_score = 0.0;
        return;
    }
    double sum = 0.0;
    for (const auto& entry : pair_scores) {
        sum += entry.second;
    }
    aggregate_score = sum / static_cast<double>(pair_scores.size());
}

CorrelationGroupView CorrelationGroupView::from_group(const CorrelationGroup& group) {
    CorrelationGroupView view;
    view.id = group.id;
    view.title = group.title;
    view.primary_incident_id = group.primary_incident_id;
    view.members.reserve(group.members.size());
    for (const auto& member : group.members) {
        view.members.push_back(member.first);
    }
    view.status = group.status;
    view.aggregate_score = group.aggregate_score;
    view.correlation_count = group.pair_scores.size();
    view.created_at = group.created_at;
    view.updated_at = group.updated_at;
    return view;
}

nlohmann::json CorrelationGroupView::to_json() const {
    return {
        {"id", id},
        {"title", title},
        {"primary_incident_id", primary_incident_id},
        {"members", members},
        {"status", to_string(status)},
        {"aggregate_score", aggregate_score},
        {"correlation_count", correlation_count},
        {"created_at", util::format_iso8601(created_at)},
        {"updated_at", util::format_iso8601(updated_at)}
    };
}

CorrelationGroupSummary CorrelationGroupSummary::from_group(const CorrelationGroup& group) {
    CorrelationGroupSummary summary;
    summary.id = group.id;
    summary.title = group.title;
    summary.primary_incident_id = group.primary_incident_id;
    summary.size = group.members.size();
    summary.status = group.status;
    summary.aggregate_score = group.aggregate_score;
    summary.updated_at = group.updated_at;
    return summary;
}

nlohmann::json CorrelationGroupSummary::to_json() const {
    return {
        {"id", id},
        {"title", title},
        {"primary_incident_id", primary_incident_id},
        {"size", size},
        {"status", to_string(status)},
        {"aggregate_score", aggregate_score},
        {"updated_at", util::format_iso8601(updated_at)}
    };
}

nlohmann::json DedupResult::to_json() const {
    nlohmann::json j = {
        {"outcome", is_duplicate() ? "duplicate" : "new"},
        {"occurrences", occurrences}
    };
    if (is_duplicate()) {
        j["existing_id"] = existing_id;
    }
    return j;
}

nlohmann::json AnalysisResult::to_json() const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : correlations) {
        records.push_back(record.to_json());
    }

    nlohmann::json mutation_list = nlohmann::json::array();
    for (const auto& m : mutations) {
        nlohmann::json entry = {
            {"mutation", to_string(m.mutation)},
            {"group_id", m.group_id}
        };
        if (!m.absorbed_group_id.empty()) {
            entry["absorbed_group_id"] = m.absorbed_group_id;
        }
        mutation_list.push_back(entry);
    }

    nlohmann::json j = {
        {"incident_id", incident_id},
        {"dedup", dedup.to_json()},
        {"correlations", records},
        {"group_id", nullptr},
        {"mutations", mutation_list},
        {"processing_time_ms", processing_time_ms}
    };
    if (group_id) {
        j["group_id"] = *group_id;
    }
    return j;
}

nlohmann::json EngineStats::to_json() const {
    return {
        {"total_groups", total_groups},
        {"active", active},
        {"stable", stable},
        {"resolved", resolved},
        {"archived", archived},
        {"total_correlations", total_correlations},
        {"mapped_incidents", mapped_incidents},
        {"dedup_entries", dedup_entries}
    };
}

CommandRequest CommandRequest::from_json(const nlohmann::json& j) {
    CommandRequest req;
    req.cmd = j.at("cmd").get<std::string>();
    req.args = j.value("args", nlohmann::json::object());
    req.corr_id = j.value("corr_id", "");
    if (j.contains("ts") && j["ts"].is_string()) {
        req.timestamp = util::parse_iso8601(j["ts"].get<std::string>());
    } else {
        req.timestamp = std::chrono::system_clock::now();
    }
    return req;
}

nlohmann::json CommandReply::to_json() const {
    return {
        {"corr_id", corr_id},
        {"ok", ok},
        {"message", message},
        {"data", data},
        {"ts", util::format_iso8601(timestamp)}
    };
}
