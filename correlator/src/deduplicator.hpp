#pragma once

#include "config.hpp"
#include "incident_store.hpp"
#include "types.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Rolling-window index from fingerprint to the most recent incident carrying it
class Deduplicator {
public:
    Deduplicator(const Config& config, IncidentStore& store);

    // Returns Duplicate if the fingerprint was seen within dedup_window_secs of
    // `now`; otherwise records the incident as the new holder of the fingerprint.
    DedupResult check_and_record(const Incident& incident, TimePoint now);

    // Drop entries whose window lapsed; returns the number removed
    size_t sweep_expired(TimePoint now);

    // Drop entries pointing at deleted incidents
    size_t forget(const std::unordered_set<std::string>& deleted_ids);

    std::vector<std::string> tracked_incident_ids() const;
    size_t size() const;

private:
    struct Entry {
        std::string incident_id;
        TimePoint last_seen_at;
        uint64_t occurrences = 0;
    };

    bool within_window(const Entry& entry, TimePoint now) const;

    const Config& config_;
    IncidentStore& store_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
