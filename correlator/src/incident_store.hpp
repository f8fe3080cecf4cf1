#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <cstddef>

struct IncidentFilter {
    std::optional<std::string> source;
    std::optional<std::string> category;
    std::optional<std::string> exclude_id;
    size_t limit = 1000;
};

// Source of candidate incidents. Implementations may throw on transient
// failures; callers log and retry.
class IncidentStore {
public:
    virtual ~IncidentStore() = default;

    // Look up a single incident
    virtual std::optional<Incident> get_incident(const std::string& id) = 0;

    // Incidents created at or after `since` matching the filter, oldest first
    virtual std::vector<Incident> list_recent(const IncidentFilter& filter, TimePoint since) = 0;

    // Append a duplicate-occurrence entry to an incident's timeline
    virtual void record_occurrence(const OccurrenceEvent& event) = 0;
};

class InMemoryIncidentStore : public IncidentStore {
public:
    std::optional<Incident> get_incident(const std::string& id) override;
    std::vector<Incident> list_recent(const IncidentFilter& filter, TimePoint since) override;
    void record_occurrence(const OccurrenceEvent& event) override;

    // Insert or replace an incident
    void save(const Incident& incident);

    // Returns false if the incident is unknown
    bool mark_resolved(const std::string& id, TimePoint resolved_at);

    bool remove(const std::string& id);

    // Drop incidents created before the cutoff; returns the number removed
    size_t evict_before(TimePoint cutoff);

    std::vector<OccurrenceEvent> timeline(const std::string& id) const;
    size_t occurrence_count(const std::string& id) const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Incident> incidents_;
    std::unordered_map<std::string, std::vector<OccurrenceEvent>> timelines_;
};
