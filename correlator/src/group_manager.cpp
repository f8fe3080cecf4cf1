#include "group_manager.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

GroupManager::GroupManager(const Config& config, CorrelationLedger& ledger)
    : config_(config), ledger_(ledger) {}

GroupMutationResult GroupManager::ingest(const CorrelationRecord& record, const Incident& a, const Incident& b,
                                         TimePoint now) {
    ledger_.add(record);

    const std::string& id_a = record.incident_a;
    const std::string& id_b = record.incident_b;
    if (id_a == id_b) {
        return {};
    }
    const Incident& incident_a = a.id == id_a ? a : b;
    const Incident& incident_b = a.id == id_a ? b : a;

    // Retry until the mappings read from the index still hold once the
    // affected group locks are taken
    while (true) {
        bool retry = false;
        GroupMutationResult result;

        auto group_a = lookup_group(id_a);
        auto group_b = lookup_group(id_b);

        if (!group_a && !group_b) {
            result = create_group(record, incident_a, incident_b, now, retry);
        } else if (group_a && !group_b) {
            auto slot = find_slot(*group_a);
            if (!slot) continue;
            result = add_member(slot, id_a, record, incident_b, now, retry);
        } else if (!group_a && group_b) {
            auto slot = find_slot(*group_b);
            if (!slot) continue;
            result = add_member(slot, id_b, record, incident_a, now, retry);
        } else if (*group_a == *group_b) {
            auto slot = find_slot(*group_a);
            if (!slot) continue;
            result = touch_same_group(slot, record, now, retry);
        } else {
            auto slot_a = find_slot(*group_a);
            auto slot_b = find_slot(*group_b);
            if (!slot_a || !slot_b) continue;
            result = merge_pair(slot_a, slot_b, record, now, retry);
        }

        if (!retry) {
            return result;
        }
        spdlog::debug("Group index changed while ingesting {} <-> {}, retrying", id_a, id_b);
    }
}

GroupMutationResult GroupManager::create_group(const CorrelationRecord& record, const Incident& a,
                                               const Incident& b, TimePoint now, bool& retry) {
    auto slot = std::make_shared<Slot>();
    CorrelationGroup& group = slot->group;
    group.id = util::generate_uuid();
    group.members.emplace(a.id, a.created_at);
    group.members.emplace(b.id, b.created_at);
    group.record_pair_score(a.id, b.id, record.score);
    group.status = GroupStatus::Active;
    group.created_at = now;
    group.updated_at = now;
    group.last_member_added_at = now;
    refresh_primary(group);
    group.title = "Correlated: " + (group.primary_incident_id == a.id ? a.title : b.title);

    const std::string group_id = group.id;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        if (incident_to_group_.count(a.id) > 0 || incident_to_group_.count(b.id) > 0) {
            retry = true;
            return {};
        }
        groups_.emplace(group_id, slot);
        incident_to_group_[a.id] = group_id;
        incident_to_group_[b.id] = group_id;
    }

    spdlog::info("Created correlation group {} for {} and {} (score {:.2f})",
                 group_id, a.id, b.id, record.score);
    return {GroupMutation::Created, group_id, ""};
}

GroupMutationResult GroupManager::add_member(const SlotPtr& slot, const std::string& anchor_id,
                                             const CorrelationRecord& record, const Incident& joining,
                                             TimePoint now, bool& retry) {
    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;

    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        auto anchor_it = incident_to_group_.find(anchor_id);
        if (!slot->alive || anchor_it == incident_to_group_.end() || anchor_it->second != group.id ||
            incident_to_group_.count(joining.id) > 0) {
            retry = true;
            return {};
        }

        if (!is_open(group.status)) {
            spdlog::debug("Group {} is {}, not adding {}", group.id, to_string(group.status), joining.id);
            return {GroupMutation::GroupClosed, group.id, ""};
        }

        if (group.size() >= config_.max_group_size) {
            spdlog::warn("Group {} is full ({} members), incident {} stays ungrouped",
                         group.id, group.size(), joining.id);
            return {GroupMutation::GroupFull, group.id, ""};
        }

        incident_to_group_[joining.id] = group.id;
    }

    group.members[joining.id] = joining.created_at;
    group.record_pair_score(record.incident_a, record.incident_b, record.score);
    group.last_member_added_at = now;
    reopen(group, now);

    refresh_primary(group);
    if (group.primary_incident_id == joining.id) {
        group.title = "Correlated: " + joining.title;
    }

    spdlog::info("Added {} to group {} ({} members, aggregate {:.2f})",
                 joining.id, group.id, group.size(), group.aggregate_score);
    return {GroupMutation::MemberAdded, group.id, ""};
}

GroupMutationResult GroupManager::touch_same_group(const SlotPtr& slot, const CorrelationRecord& record,
                                                   TimePoint now, bool& retry) {
    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;

    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        auto it_a = incident_to_group_.find(record.incident_a);
        auto it_b = incident_to_group_.find(record.incident_b);
        if (!slot->alive || it_a == incident_to_group_.end() || it_b == incident_to_group_.end() ||
            it_a->second != group.id || it_b->second != group.id) {
            retry = true;
            return {};
        }
    }

    if (!is_open(group.status)) {
        return {GroupMutation::GroupClosed, group.id, ""};
    }

    group.record_pair_score(record.incident_a, record.incident_b, record.score);
    reopen(group, now);
    return {GroupMutation::Unchanged, group.id, ""};
}

GroupMutationResult GroupManager::merge_pair(const SlotPtr& left, const SlotPtr& right,
                                             const CorrelationRecord& record, TimePoint now, bool& retry) {
    std::scoped_lock group_locks(left->mutex, right->mutex);

    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        auto it_a = incident_to_group_.find(record.incident_a);
        auto it_b = incident_to_group_.find(record.incident_b);
        if (!left->alive || !right->alive ||
            it_a == incident_to_group_.end() || it_b == incident_to_group_.end() ||
            it_a->second != left->group.id || it_b->second != right->group.id) {
            retry = true;
            return {};
        }
    }

    bool force = record.strategy == StrategyKind::Manual;
    return merge_locked(*left, *right, &record, force, now);
}

GroupMutationResult GroupManager::try_merge(const std::string& left_id, const std::string& right_id,
                                            TimePoint now) {
    if (left_id == right_id) {
        return {};
    }

    auto left = find_slot(left_id);
    auto right = find_slot(right_id);
    if (!left || !right) {
        return {};
    }

    std::scoped_lock group_locks(left->mutex, right->mutex);
    if (!left->alive || !right->alive) {
        return {};
    }
    return merge_locked(*left, *right, nullptr, false, now);
}

GroupMutationResult GroupManager::merge_locked(Slot& left, Slot& right, const CorrelationRecord* bridge,
                                               bool force, TimePoint now) {
    CorrelationGroup& l = left.group;
    CorrelationGroup& r = right.group;

    if (!is_open(l.status) || !is_open(r.status)) {
        return {GroupMutation::GroupClosed, is_open(l.status) ? r.id : l.id, ""};
    }

    if (!force) {
        std::set<std::string> left_members;
        std::set<std::string> right_members;
        for (const auto& member : l.members) left_members.insert(member.first);
        for (const auto& member : r.members) right_members.insert(member.first);

        auto compatibility = ledger_.cross_compatibility(left_members, right_members);
        if (!compatibility || *compatibility < config_.merge_threshold) {
            spdlog::debug("Merge of {} and {} rejected (compatibility {:.2f} < {:.2f})",
                          l.id, r.id, compatibility.value_or(0.0), config_.merge_threshold);
            return {GroupMutation::MergeRejected, l.id, ""};
        }
    }

    if (l.size() + r.size() > config_.max_group_size) {
        spdlog::warn("Merge of {} and {} rejected: {} members would exceed max_group_size {}",
                     l.id, r.id, l.size() + r.size(), config_.max_group_size);
        return {GroupMutation::GroupFull, l.id, ""};
    }

    // Earlier group survives; ID breaks ties
    bool left_survives = l.created_at < r.created_at || (l.created_at == r.created_at && l.id < r.id);
    Slot& keep_slot = left_survives ? left : right;
    Slot& gone_slot = left_survives ? right : left;
    CorrelationGroup& keep = keep_slot.group;
    CorrelationGroup& gone = gone_slot.group;

    keep.members.insert(gone.members.begin(), gone.members.end());
    keep.pair_scores.insert(gone.pair_scores.begin(), gone.pair_scores.end());
    if (bridge) {
        keep.record_pair_score(bridge->incident_a, bridge->incident_b, bridge->score);
    } else {
        keep.recalculate_aggregate_score();
    }

    refresh_primary(keep);
    if (keep.primary_incident_id == gone.primary_incident_id) {
        keep.title = gone.title;
    }
    keep.last_member_added_at = now;
    keep.updated_at = now;
    keep.status = GroupStatus::Active;

    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        for (const auto& member : gone.members) {
            incident_to_group_[member.first] = keep.id;
        }
        groups_.erase(gone.id);
    }
    gone_slot.alive = false;

    spdlog::info("Merged group {} into {} ({} members, aggregate {:.2f})",
                 gone.id, keep.id, keep.size(), keep.aggregate_score);
    return {GroupMutation::Merged, keep.id, gone.id};
}

std::vector<std::pair<std::string, std::string>> GroupManager::linked_group_pairs() const {
    std::unordered_map<std::string, std::string> index_copy;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        index_copy = incident_to_group_;
    }

    std::set<std::pair<std::string, std::string>> pairs;
    for (const auto& entry : index_copy) {
        for (const auto& record : ledger_.for_incident(entry.first)) {
            if (!CorrelationLedger::forms_groups(record.strategy)) continue;

            const std::string& other = record.incident_a == entry.first ? record.incident_b : record.incident_a;
            auto other_it = index_copy.find(other);
            if (other_it == index_copy.end() || other_it->second == entry.second) continue;

            pairs.insert(std::minmax(entry.second, other_it->second));
        }
    }
    return std::vector<std::pair<std::string, std::string>>(pairs.begin(), pairs.end());
}

std::optional<std::string> GroupManager::group_of(const std::string& incident_id) const {
    return lookup_group(incident_id);
}

std::optional<CorrelationGroupView> GroupManager::view(const std::string& group_id) const {
    auto slot = find_slot(group_id);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> group_lock(slot->mutex);
    if (!slot->alive) {
        return std::nullopt;
    }
    return CorrelationGroupView::from_group(slot->group);
}

std::optional<CorrelationGroupView> GroupManager::view_for_incident(const std::string& incident_id) const {
    while (true) {
        auto group_id = lookup_group(incident_id);
        if (!group_id) {
            return std::nullopt;
        }
        auto slot = find_slot(*group_id);
        if (!slot) continue;

        std::lock_guard<std::mutex> group_lock(slot->mutex);
        if (!slot->alive) continue;
        if (!slot->group.contains(incident_id) || slot->group.status == GroupStatus::Archived) {
            return std::nullopt;
        }
        return CorrelationGroupView::from_group(slot->group);
    }
}

std::vector<CorrelationGroupSummary> GroupManager::summaries(std::optional<GroupStatus> status) const {
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        slots.reserve(groups_.size());
        for (const auto& entry : groups_) {
            slots.push_back(entry.second);
        }
    }

    std::vector<std::pair<TimePoint, CorrelationGroupSummary>> collected;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> group_lock(slot->mutex);
        if (!slot->alive) continue;
        if (status && slot->group.status != *status) continue;
        collected.emplace_back(slot->group.created_at, CorrelationGroupSummary::from_group(slot->group));
    }

    std::sort(collected.begin(), collected.end(), [](const auto& x, const auto& y) {
        if (x.first != y.first) return x.first < y.first;
        return x.second.id < y.second.id;
    });

    std::vector<CorrelationGroupSummary> result;
    result.reserve(collected.size());
    for (auto& entry : collected) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

std::vector<std::string> GroupManager::snapshot_ids() const {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    std::vector<std::string> ids;
    ids.reserve(groups_.size());
    for (const auto& entry : groups_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void GroupManager::resolve(const std::string& group_id, TimePoint now) {
    auto slot = find_slot(group_id);
    if (!slot) {
        throw GroupNotFoundError(group_id);
    }

    std::lock_guard<std::mutex> group_lock(slot->mutex);
    if (!slot->alive) {
        throw GroupNotFoundError(group_id);
    }

    CorrelationGroup& group = slot->group;
    if (!is_open(group.status)) {
        return;
    }
    group.status = GroupStatus::Resolved;
    group.updated_at = now;
    spdlog::info("Group {} resolved", group.id);
}

bool GroupManager::stabilize_if_idle(const std::string& group_id, TimePoint now,
                                     std::chrono::seconds idle_after) {
    auto slot = find_slot(group_id);
    if (!slot) return false;

    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;
    if (!slot->alive || group.status != GroupStatus::Active) return false;
    if (now - group.last_member_added_at < idle_after) return false;

    group.status = GroupStatus::Stable;
    group.updated_at = now;
    spdlog::debug("Group {} stabilized", group.id);
    return true;
}

bool GroupManager::resolve_if_settled(const std::string& group_id,
                                      const std::set<std::string>& resolved_incidents, TimePoint now) {
    auto slot = find_slot(group_id);
    if (!slot) return false;

    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;
    if (!slot->alive || !is_open(group.status) || group.members.empty()) return false;

    for (const auto& member : group.members) {
        if (resolved_incidents.count(member.first) == 0) {
            return false;
        }
    }

    group.status = GroupStatus::Resolved;
    group.updated_at = now;
    spdlog::info("Group {} resolved: all {} members resolved", group.id, group.size());
    return true;
}

bool GroupManager::archive_if_expired(const std::string& group_id, TimePoint now,
                                      std::chrono::seconds archive_after) {
    auto slot = find_slot(group_id);
    if (!slot) return false;

    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;
    if (!slot->alive || group.status != GroupStatus::Resolved) return false;
    if (now - group.updated_at < archive_after) return false;

    group.status = GroupStatus::Archived;
    group.archived_at = now;
    group.updated_at = now;

    // Release the members so they can join new groups
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        for (const auto& member : group.members) {
            auto it = incident_to_group_.find(member.first);
            if (it != incident_to_group_.end() && it->second == group.id) {
                incident_to_group_.erase(it);
            }
        }
    }

    spdlog::info("Group {} archived", group.id);
    return true;
}

bool GroupManager::purge_if_expired(const std::string& group_id, TimePoint now, std::chrono::seconds retention) {
    auto slot = find_slot(group_id);
    if (!slot) return false;

    std::lock_guard<std::mutex> group_lock(slot->mutex);
    CorrelationGroup& group = slot->group;
    if (!slot->alive || group.status != GroupStatus::Archived || !group.archived_at) return false;
    if (now - *group.archived_at < retention) return false;

    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        groups_.erase(group.id);
    }
    slot->alive = false;

    spdlog::debug("Group {} deleted by retention sweep", group.id);
    return true;
}

size_t GroupManager::forget_members(const std::unordered_set<std::string>& deleted_ids) {
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        slots.reserve(groups_.size());
        for (const auto& entry : groups_) {
            slots.push_back(entry.second);
        }
    }

    size_t removed = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> group_lock(slot->mutex);
        if (!slot->alive) continue;
        CorrelationGroup& group = slot->group;

        std::vector<std::string> gone;
        for (const auto& member : group.members) {
            if (deleted_ids.count(member.first) > 0) {
                gone.push_back(member.first);
            }
        }
        if (gone.empty()) continue;

        for (const auto& id : gone) {
            group.members.erase(id);
        }
        for (auto it = group.pair_scores.begin(); it != group.pair_scores.end();) {
            if (deleted_ids.count(it->first.first) > 0 || deleted_ids.count(it->first.second) > 0) {
                it = group.pair_scores.erase(it);
            } else {
                ++it;
            }
        }
        group.recalculate_aggregate_score();
        refresh_primary(group);
        removed += gone.size();

        {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            for (const auto& id : gone) {
                auto it = incident_to_group_.find(id);
                if (it != incident_to_group_.end() && it->second == group.id) {
                    incident_to_group_.erase(it);
                }
            }
            if (group.members.empty()) {
                groups_.erase(group.id);
                slot->alive = false;
            }
        }

        spdlog::info("Removed {} deleted incident(s) from group {} ({} left)",
                     gone.size(), group.id, group.size());
    }
    return removed;
}

void GroupManager::fill_stats(EngineStats& stats) const {
    std::vector<SlotPtr> slots;
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        stats.mapped_incidents = incident_to_group_.size();
        slots.reserve(groups_.size());
        for (const auto& entry : groups_) {
            slots.push_back(entry.second);
        }
    }

    stats.total_groups = 0;
    stats.active = stats.stable = stats.resolved = stats.archived = 0;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> group_lock(slot->mutex);
        if (!slot->alive) continue;

        ++stats.total_groups;
        switch (slot->group.status) {
            case GroupStatus::Active: ++stats.active; break;
            case GroupStatus::Stable: ++stats.stable; break;
            case GroupStatus::Resolved: ++stats.resolved; break;
            case GroupStatus::Archived: ++stats.archived; break;
        }
    }
}

GroupManager::SlotPtr GroupManager::find_slot(const std::string& group_id) const {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    auto it = groups_.find(group_id);
    return it == groups_.end() ? nullptr : it->second;
}

std::optional<std::string> GroupManager::lookup_group(const std::string& incident_id) const {
    std::lock_guard<std::mutex> index_lock(index_mutex_);
    auto it = incident_to_group_.find(incident_id);
    if (it == incident_to_group_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void GroupManager::reopen(CorrelationGroup& group, TimePoint now) {
    if (group.status == GroupStatus::Stable) {
        group.status = GroupStatus::Active;
        // Restart the idle clock, otherwise the next tick stabilizes it again
        group.last_member_added_at = now;
        spdlog::debug("Group {} reopened", group.id);
    }
    group.updated_at = now;
}

void GroupManager::refresh_primary(CorrelationGroup& group) {
    // members is ordered by ID, so the strict comparison keeps the smaller ID on ties
    const std::pair<const std::string, TimePoint>* earliest = nullptr;
    for (const auto& member : group.members) {
        if (!earliest || member.second < earliest->second) {
            earliest = &member;
        }
    }
    if (earliest) {
        group.primary_incident_id = earliest->first;
    }
}
