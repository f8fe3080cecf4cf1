#include "incident_store.hpp"
#include <algorithm>

std::optional<Incident> InMemoryIncidentStore::get_incident(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(id);
    if (it == incidents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Incident> InMemoryIncidentStore::list_recent(const IncidentFilter& filter, TimePoint since) {
    std::vector<Incident> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : incidents_) {
            const auto& incident = entry.second;
            if (incident.created_at < since) continue;
            if (filter.exclude_id && incident.id == *filter.exclude_id) continue;
            if (filter.source && incident.source != *filter.source) continue;
            if (filter.category && incident.category != *filter.category) continue;
            result.push_back(incident);
        }
    }

    std::sort(result.begin(), result.end(), [](const Incident& a, const Incident& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });

    // Keep the most recent incidents when over the limit
    if (result.size() > filter.limit) {
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(filter.limit));
    }
    return result;
}

void InMemoryIncidentStore::record_occurrence(const OccurrenceEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    timelines_[event.incident_id].push_back(event);
}

void InMemoryIncidentStore::save(const Incident& incident) {
    std::lock_guard<std::mutex> lock(mutex_);
    incidents_[incident.id] = incident;
}

bool InMemoryIncidentStore::mark_resolved(const std::string& id, TimePoint resolved_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = incidents_.find(id);
    if (it == incidents_.end()) {
        return false;
    }
    it->second.resolved_at = resolved_at;
    return true;
}

bool InMemoryIncidentStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timelines_.erase(id);
    return incidents_.erase(id) > 0;
}

size_t InMemoryIncidentStore::evict_before(TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = incidents_.begin(); it != incidents_.end();) {
        if (it->second.created_at < cutoff) {
            timelines_.erase(it->first);
            it = incidents_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<OccurrenceEvent> InMemoryIncidentStore::timeline(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timelines_.find(id);
    if (it == timelines_.end()) {
        return {};
    }
    return it->second;
}

size_t InMemoryIncidentStore::occurrence_count(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timelines_.find(id);
    return it == timelines_.end() ? 0 : it->second.size();
}

size_t InMemoryIncidentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incidents_.size();
}
