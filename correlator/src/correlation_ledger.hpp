#pragma once

#include "types.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <map>
#include <unordered_set>
#include <vector>

// Audit store of correlation records. Holds the latest record per
// (incident_a, incident_b, strategy); a re-scored pair supersedes the
// earlier record instead of mutating it.
class CorrelationLedger {
public:
    // Store a record; returns the record it superseded, if any
    std::optional<CorrelationRecord> add(const CorrelationRecord& record);

    std::vector<CorrelationRecord> for_incident(const std::string& incident_id) const;

    // Mean score of group-forming records (Combined or Manual) linking a
    // member of `left` to a member of `right`; nullopt if none exist
    std::optional<double> cross_compatibility(const std::set<std::string>& left,
                                              const std::set<std::string>& right) const;

    // Drop records touching any of the given incidents; returns the number removed
    size_t forget(const std::unordered_set<std::string>& deleted_ids);

    std::vector<std::string> referenced_incident_ids() const;
    size_t size() const;

    static bool forms_groups(StrategyKind kind) {
        return kind == StrategyKind::Combined || kind == StrategyKind::Manual;
    }

private:
    using Key = std::tuple<std::string, std::string, StrategyKind>;

    mutable std::mutex mutex_;
    std::map<Key, CorrelationRecord> records_;
    std::map<std::string, std::set<Key>> by_incident_;
};
