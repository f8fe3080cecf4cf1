#include "maintenance.hpp"
#include <set>
#include <unordered_set>
#include <spdlog/spdlog.h>

MaintenanceScheduler::MaintenanceScheduler(const Config& config, GroupManager& groups,
                                           CorrelationLedger& ledger, Deduplicator& dedup,
                                           IncidentStore& store, Clock clock)
    : config_(config), groups_(groups), ledger_(ledger), dedup_(dedup), store_(store),
      clock_(std::move(clock)) {}

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
}

void MaintenanceScheduler::start() {
    if (running_) {
        spdlog::warn("Maintenance scheduler is already running");
        return;
    }

    running_ = true;
    scheduler_thread_ = std::thread(&MaintenanceScheduler::scheduler_loop, this);
    spdlog::info("Maintenance scheduler started (interval {}s)", config_.maintenance_interval_secs);
}

void MaintenanceScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    wake_cv_.notify_all();

    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    spdlog::info("Maintenance scheduler stopped");
}

void MaintenanceScheduler::scheduler_loop() {
    const auto interval = std::chrono::seconds(config_.maintenance_interval_secs);

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }

        // A tick always runs to completion; shutdown is observed between ticks
        tick(clock_());
    }
}

MaintenanceReport MaintenanceScheduler::tick(TimePoint now) {
    MaintenanceReport report;

    for (const auto& group_id : groups_.snapshot_ids()) {
        try {
            sweep_group(group_id, now, report);
        } catch (const std::exception& e) {
            ++report.failures;
            spdlog::error("Maintenance failed for group {}: {}", group_id, e.what());
        }
    }

    if (config_.auto_merge_groups) {
        auto_merge(now, report);
    }

    try {
        prune_dangling(report);
    } catch (const std::exception& e) {
        ++report.failures;
        spdlog::error("Pruning dangling correlation state failed: {}", e.what());
    }

    report.expired_dedup_entries = dedup_.sweep_expired(now);

    if (report.changed() || report.failures > 0) {
        spdlog::info("Maintenance tick: {} stabilized, {} resolved, {} archived, {} deleted, {} merged, "
                     "{} records pruned, {} dedup entries pruned, {} members released, {} expired, {} failures",
                     report.stabilized, report.resolved, report.archived, report.purged, report.merged,
                     report.pruned_records, report.pruned_dedup_entries, report.released_members,
                     report.expired_dedup_entries, report.failures);
    } else {
        spdlog::debug("Maintenance tick: nothing to do");
    }
    return report;
}

void MaintenanceScheduler::sweep_group(const std::string& group_id, TimePoint now, MaintenanceReport& report) {
    auto view = groups_.view(group_id);
    if (!view) {
        return;
    }

    if (view->status == GroupStatus::Active || view->status == GroupStatus::Stable) {
        if (groups_.stabilize_if_idle(group_id, now, std::chrono::seconds(config_.stabilize_after_secs))) {
            ++report.stabilized;
        }

        // Store lookups happen outside the group lock; the transition re-checks membership.
        // A member already deleted from the store no longer holds the group open.
        std::set<std::string> resolved;
        for (const auto& member : view->members) {
            auto incident = store_.get_incident(member);
            if (!incident || incident->is_resolved()) {
                resolved.insert(member);
            }
        }
        if (resolved.size() == view->members.size() && groups_.resolve_if_settled(group_id, resolved, now)) {
            ++report.resolved;
        }
    }

    if (groups_.archive_if_expired(group_id, now, std::chrono::seconds(config_.archive_after_secs))) {
        ++report.archived;
    }

    if (groups_.purge_if_expired(group_id, now, std::chrono::seconds(config_.retention_after_secs))) {
        ++report.purged;
    }
}

void MaintenanceScheduler::auto_merge(TimePoint now, MaintenanceReport& report) {
    for (const auto& pair : groups_.linked_group_pairs()) {
        auto result = groups_.try_merge(pair.first, pair.second, now);
        if (result.mutation == GroupMutation::Merged) {
            ++report.merged;
        }
    }
}

void MaintenanceScheduler::prune_dangling(MaintenanceReport& report) {
    std::unordered_set<std::string> referenced;
    for (auto& id : ledger_.referenced_incident_ids()) {
        referenced.insert(std::move(id));
    }
    for (auto& id : dedup_.tracked_incident_ids()) {
        referenced.insert(std::move(id));
    }

    std::unordered_set<std::string> deleted;
    for (const auto& id : referenced) {
        if (!store_.get_incident(id)) {
            deleted.insert(id);
        }
    }

    if (deleted.empty()) {
        return;
    }

    report.pruned_records = ledger_.forget(deleted);
    report.pruned_dedup_entries = dedup_.forget(deleted);
    report.released_members = groups_.forget_members(deleted);
}
