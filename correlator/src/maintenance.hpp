#pragma once

#include "config.hpp"
#include "correlation_ledger.hpp"
#include "deduplicator.hpp"
#include "group_manager.hpp"
#include "incident_store.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

struct MaintenanceReport {
    size_t stabilized = 0;
    size_t resolved = 0;
    size_t archived = 0;
    size_t purged = 0;
    size_t merged = 0;
    size_t pruned_records = 0;
    size_t pruned_dedup_entries = 0;
    size_t released_members = 0;
    size_t expired_dedup_entries = 0;
    size_t failures = 0;

    bool changed() const {
        return stabilized + resolved + archived + purged + merged +
               pruned_records + pruned_dedup_entries + released_members + expired_dedup_entries > 0;
    }
};

// Periodic lifecycle sweep over the group index. Each tick works from a
// snapshot of group IDs and takes one group lock at a time.
class MaintenanceScheduler {
public:
    MaintenanceScheduler(const Config& config, GroupManager& groups, CorrelationLedger& ledger,
                         Deduplicator& dedup, IncidentStore& store, Clock clock);
    ~MaintenanceScheduler();

    void start();

    // Returns once the current tick, if any, has completed
    void stop();

    bool is_running() const { return running_; }

    // One full sweep; exposed so tests can drive time explicitly
    MaintenanceReport tick(TimePoint now);

private:
    void scheduler_loop();

    void sweep_group(const std::string& group_id, TimePoint now, MaintenanceReport& report);
    void auto_merge(TimePoint now, MaintenanceReport& report);
    void prune_dangling(MaintenanceReport& report);

    const Config& config_;
    GroupManager& groups_;
    CorrelationLedger& ledger_;
    Deduplicator& dedup_;
    IncidentStore& store_;
    Clock clock_;

    std::atomic<bool> running_{false};
    std::thread scheduler_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};
