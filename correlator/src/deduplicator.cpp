#include "deduplicator.hpp"
#include "fingerprint.hpp"
#include <spdlog/spdlog.h>

Deduplicator::Deduplicator(const Config& config, IncidentStore& store)
    : config_(config), store_(store) {}

DedupResult Deduplicator::check_and_record(const Incident& incident, TimePoint now) {
    std::string fingerprint = incident.fingerprint.empty()
        ? FingerprintGenerator().fingerprint(incident)
        : incident.fingerprint;

    DedupResult result;
    OccurrenceEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);

        if (it != entries_.end() && within_window(it->second, now)) {
            Entry& entry = it->second;
            entry.last_seen_at = now;

            // Resubmission of the holder itself is not a new occurrence
            if (entry.incident_id == incident.id) {
                result.outcome = DedupOutcome::New;
                result.occurrences = entry.occurrences;
                return result;
            }

            entry.occurrences++;
            result.outcome = DedupOutcome::Duplicate;
            result.existing_id = entry.incident_id;
            result.occurrences = entry.occurrences;

            event.incident_id = entry.incident_id;
            event.duplicate_id = incident.id;
            event.fingerprint = fingerprint;
            event.source = incident.source;
            event.occurrence = entry.occurrences;
            event.occurred_at = now;
        } else {
            // Absent or lapsed: this incident becomes the holder
            entries_[fingerprint] = Entry{incident.id, now, 0};
            result.outcome = DedupOutcome::New;
            return result;
        }
    }

    spdlog::debug("Incident {} is a duplicate of {} (occurrence {})",
                  incident.id, result.existing_id, result.occurrences);

    try {
        store_.record_occurrence(event);
    } catch (const std::exception& e) {
        spdlog::error("Failed to append occurrence to incident {} timeline: {}",
                      result.existing_id, e.what());
    }

    return result;
}

size_t Deduplicator::sweep_expired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!within_window(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t Deduplicator::forget(const std::unordered_set<std::string>& deleted_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (deleted_ids.count(it->second.incident_id) > 0) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::string> Deduplicator::tracked_incident_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) {
        ids.push_back(entry.second.incident_id);
    }
    return ids;
}

size_t Deduplicator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool Deduplicator::within_window(const Entry& entry, TimePoint now) const {
    return now - entry.last_seen_at <= std::chrono::seconds(config_.dedup_window_secs);
}
