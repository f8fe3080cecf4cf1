#pragma once

#include "config.hpp"
#include "correlation_ledger.hpp"
#include "types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// Owns the correlation groups and the incident -> group reverse index.
//
// Locking: every group lives in its own slot with its own mutex. The index
// mutex guards only the slot map and the reverse index and is held briefly.
// Slot locks are always taken before the index lock, never the reverse.
// Callers that read the index and then lock a slot re-validate the mapping
// and retry if a concurrent writer moved the incident in between.
class GroupManager {
public:
    GroupManager(const Config& config, CorrelationLedger& ledger);

    // Apply a group-forming record. `a` and `b` are the two incidents the
    // record links, in either order. The record is stored in the ledger
    // whatever the outcome. Manual records bypass the merge threshold.
    GroupMutationResult ingest(const CorrelationRecord& record, const Incident& a, const Incident& b,
                               TimePoint now);

    // Merge two live groups when the ledger shows enough cross-group evidence
    GroupMutationResult try_merge(const std::string& left_id, const std::string& right_id, TimePoint now);

    // Pairs of distinct live groups linked by at least one group-forming record
    std::vector<std::pair<std::string, std::string>> linked_group_pairs() const;

    std::optional<std::string> group_of(const std::string& incident_id) const;
    std::optional<CorrelationGroupView> view(const std::string& group_id) const;
    std::optional<CorrelationGroupView> view_for_incident(const std::string& incident_id) const;
    std::vector<CorrelationGroupSummary> summaries(std::optional<GroupStatus> status) const;

    // Consistent snapshot of group IDs for sweeps
    std::vector<std::string> snapshot_ids() const;

    // Explicit resolution; throws GroupNotFoundError. Archived groups are left as is.
    void resolve(const std::string& group_id, TimePoint now);

    // Lifecycle steps used by maintenance. Each runs under the group's lock and
    // returns true when it changed the group.
    bool stabilize_if_idle(const std::string& group_id, TimePoint now, std::chrono::seconds idle_after);
    bool resolve_if_settled(const std::string& group_id, const std::set<std::string>& resolved_incidents,
                            TimePoint now);
    bool archive_if_expired(const std::string& group_id, TimePoint now, std::chrono::seconds archive_after);
    bool purge_if_expired(const std::string& group_id, TimePoint now, std::chrono::seconds retention);

    // Drop incidents deleted from the store from every group and from the
    // reverse index. Groups left empty are deleted. Returns members removed.
    size_t forget_members(const std::unordered_set<std::string>& deleted_ids);

    // Fills the group counters of EngineStats
    void fill_stats(EngineStats& stats) const;

private:
    struct Slot {
        std::mutex mutex;
        CorrelationGroup group;
        bool alive = true;
    };

    using SlotPtr = std::shared_ptr<Slot>;

    SlotPtr find_slot(const std::string& group_id) const;
    std::optional<std::string> lookup_group(const std::string& incident_id) const;

    GroupMutationResult create_group(const CorrelationRecord& record, const Incident& a, const Incident& b,
                                     TimePoint now, bool& retry);
    GroupMutationResult add_member(const SlotPtr& slot, const std::string& anchor_id,
                                   const CorrelationRecord& record, const Incident& joining,
                                   TimePoint now, bool& retry);
    GroupMutationResult touch_same_group(const SlotPtr& slot, const CorrelationRecord& record,
                                         TimePoint now, bool& retry);
    GroupMutationResult merge_pair(const SlotPtr& left, const SlotPtr& right, const CorrelationRecord& record,
                                   TimePoint now, bool& retry);

    // Both slots locked by the caller
    GroupMutationResult merge_locked(Slot& left, Slot& right, const CorrelationRecord* bridge, bool force,
                                     TimePoint now);

    static bool is_open(GroupStatus status) {
        return status == GroupStatus::Active || status == GroupStatus::Stable;
    }
    static void reopen(CorrelationGroup& group, TimePoint now);
    static void refresh_primary(CorrelationGroup& group);

    const Config& config_;
    CorrelationLedger& ledger_;

    mutable std::mutex index_mutex_;
    std::map<std::string, SlotPtr> groups_;
    std::unordered_map<std::string, std::string> incident_to_group_;
};
