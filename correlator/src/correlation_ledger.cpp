#include "correlation_ledger.hpp"

std::optional<CorrelationRecord> CorrelationLedger::add(const CorrelationRecord& record) {
    Key key{record.incident_a, record.incident_b, record.strategy};

    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<CorrelationRecord> superseded;

    auto it = records_.find(key);
    if (it != records_.end()) {
        superseded = it->second;
        it->second = record;
    } else {
        records_.emplace(key, record);
    }

    by_incident_[record.incident_a].insert(key);
    by_incident_[record.incident_b].insert(key);
    return superseded;
}

std::vector<CorrelationRecord> CorrelationLedger::for_incident(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CorrelationRecord> result;

    auto it = by_incident_.find(incident_id);
    if (it == by_incident_.end()) {
        return result;
    }

    for (const auto& key : it->second) {
        auto record_it = records_.find(key);
        if (record_it != records_.end()) {
            result.push_back(record_it->second);
        }
    }
    return result;
}

std::optional<double> CorrelationLedger::cross_compatibility(const std::set<std::string>& left,
                                                             const std::set<std::string>& right) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Best score per pair across the group-forming strategies
    std::map<IncidentPair, double> pair_scores;
    for (const auto& incident_id : left) {
        auto it = by_incident_.find(incident_id);
        if (it == by_incident_.end()) continue;

        for (const auto& key : it->second) {
            if (!forms_groups(std::get<2>(key))) continue;

            const std::string& other = std::get<0>(key) == incident_id ? std::get<1>(key) : std::get<0>(key);
            if (right.count(other) == 0) continue;

            const auto& record = records_.at(key);
            IncidentPair pair{record.incident_a, record.incident_b};
            auto existing = pair_scores.find(pair);
            if (existing == pair_scores.end() || existing->second < record.score) {
                pair_scores[pair] = record.score;
            }
        }
    }

    if (pair_scores.empty()) {
        return std::nullopt;
    }

    double sum = 0.0;
    for (const auto& entry : pair_scores) {
        sum += entry.second;
    }
    return sum / static_cast<double>(pair_scores.size());
}

size_t CorrelationLedger::forget(const std::unordered_set<std::string>& deleted_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    for (auto it = records_.begin(); it != records_.end();) {
        const auto& key = it->first;
        bool dangling = deleted_ids.count(std::get<0>(key)) > 0 || deleted_ids.count(std::get<1>(key)) > 0;
        if (!dangling) {
            ++it;
            continue;
        }

        for (const auto& endpoint : {std::get<0>(key), std::get<1>(key)}) {
            auto index_it = by_incident_.find(endpoint);
            if (index_it != by_incident_.end()) {
                index_it->second.erase(key);
                if (index_it->second.empty()) {
                    by_incident_.erase(index_it);
                }
            }
        }
        it = records_.erase(it);
        ++removed;
    }
    return removed;
}

std::vector<std::string> CorrelationLedger::referenced_incident_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(by_incident_.size());
    for (const auto& entry : by_incident_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t CorrelationLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}
