#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "engine.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using ::testing::ElementsAre;

class CorrelationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = std::make_unique<CorrelationEngine>(config_, store_, nullptr, clock_.as_clock());
    }

    // Store the incident and analyze it at its own creation time
    AnalysisResult submit(const Incident& incident) {
        clock_.now = incident.created_at;
        store_.save(incident);
        return engine_->analyze(incident);
    }

    static bool has_strategy(const std::vector<CorrelationRecord>& records, StrategyKind kind) {
        return std::any_of(records.begin(), records.end(),
                           [kind](const CorrelationRecord& r) { return r.strategy == kind; });
    }

    Config config_;
    ManualClock clock_;
    InMemoryIncidentStore store_;
    std::unique_ptr<CorrelationEngine> engine_;
};

TEST_F(CorrelationEngineTest, ConnectionPoolAlertsEndUpInOneGroup) {
    auto first = submit(make_incident("A", "Database connection pool exhausted", 0, "datadog"));
    EXPECT_EQ(DedupOutcome::New, first.dedup.outcome);
    EXPECT_TRUE(first.correlations.empty());
    EXPECT_FALSE(first.group_id);

    auto second = submit(make_incident("B", "Database connection pool full", 15, "datadog"));

    ASSERT_TRUE(second.group_id);
    auto combined = std::find_if(second.correlations.begin(), second.correlations.end(),
                                 [](const CorrelationRecord& r) { return r.strategy == StrategyKind::Combined; });
    ASSERT_NE(second.correlations.end(), combined);
    EXPECT_GE(combined->score, 0.5);
    EXPECT_LE(combined->score, 1.0);
    EXPECT_EQ("A", combined->incident_a);
    EXPECT_EQ("B", combined->incident_b);

    auto group = engine_->get_group("A");
    ASSERT_TRUE(group);
    EXPECT_EQ(*second.group_id, group->id);
    EXPECT_EQ(2u, group->members.size());
    EXPECT_GE(group->aggregate_score, 0.5);
    EXPECT_EQ("A", group->primary_incident_id);
}

TEST_F(CorrelationEngineTest, IncidentsOutsideTemporalWindowGetNoTemporalRecord) {
    auto a = make_incident("A", "Database connection pool exhausted", 0);
    a.resolved_at = a.created_at + std::chrono::minutes(10);
    submit(a);

    auto b = make_incident("B", "Queue consumer lag high", 20 * 60);
    b.resolved_at = b.created_at + std::chrono::minutes(5);
    auto result = submit(b);

    EXPECT_FALSE(has_strategy(result.correlations, StrategyKind::Temporal));
    for (const auto& record : engine_->correlations_for("A")) {
        EXPECT_NE(StrategyKind::Temporal, record.strategy);
    }
    EXPECT_FALSE(engine_->get_group("B"));
}

TEST_F(CorrelationEngineTest, ChainOfCorrelationsSharesOneGroup) {
    submit(make_incident("A", "Database connection pool exhausted", 0));
    submit(make_incident("B", "Database connection pool full", 20));
    auto third = submit(make_incident("C", "Database connection pool saturated", 40));

    ASSERT_TRUE(third.group_id);
    EXPECT_EQ(engine_->get_group("A")->id, *third.group_id);
    EXPECT_EQ(3u, engine_->get_group("C")->members.size());
}

TEST_F(CorrelationEngineTest, RepeatedAlertIsDeduplicated) {
    const int submissions = 4;
    AnalysisResult last;
    for (int i = 0; i < submissions; ++i) {
        clock_.now = base_time() + std::chrono::seconds(60 * i);
        auto incident = make_incident("dup-" + std::to_string(i), "Disk full on /var", 60 * i);
        last = engine_->analyze(incident);
        if (i == 0) {
            store_.save(incident);
        }
    }

    ASSERT_TRUE(last.dedup.is_duplicate());
    EXPECT_EQ("dup-0", last.dedup.existing_id);
    EXPECT_EQ(static_cast<uint64_t>(submissions - 1), last.dedup.occurrences);
    EXPECT_EQ(static_cast<size_t>(submissions - 1), store_.occurrence_count("dup-0"));
    EXPECT_TRUE(last.correlations.empty());
    EXPECT_FALSE(last.group_id);
}

TEST_F(CorrelationEngineTest, AlertAfterDedupWindowIsNewIncident) {
    submit(make_incident("first", "Disk full on /var", 0));

    auto later = make_incident("second", "Disk full on /var", static_cast<int>(config_.dedup_window_secs) + 60);
    auto result = submit(later);

    EXPECT_EQ(DedupOutcome::New, result.dedup.outcome);
}

TEST_F(CorrelationEngineTest, ManualCorrelationIgnoresThresholds) {
    config_.min_correlation_score = 1.0;
    config_.merge_threshold = 1.0;
    SetUp();

    submit(make_incident("A", "Checkout latency", 0, "datadog"));
    submit(make_incident("B", "Nightly backup failed", 7200, "cron"));
    ASSERT_FALSE(engine_->get_group("A"));

    auto record = engine_->manual_correlate({"B", "A"}, "same root cause");

    EXPECT_DOUBLE_EQ(1.0, record.score);
    EXPECT_EQ(StrategyKind::Manual, record.strategy);
    EXPECT_EQ("A", record.incident_a);
    EXPECT_EQ("B", record.incident_b);
    EXPECT_EQ("same root cause", record.reason);
    ASSERT_TRUE(engine_->get_group("A"));
    EXPECT_EQ(engine_->get_group("A")->id, engine_->get_group("B")->id);
}

TEST_F(CorrelationEngineTest, ManualCorrelationLinksSeveralIncidents) {
    submit(make_incident("A", "Checkout latency", 0, "datadog"));
    submit(make_incident("B", "Nightly backup failed", 7200, "cron"));
    submit(make_incident("C", "Certificate expiring", 14400, "certbot"));

    engine_->manual_correlate({"A", "B", "C"}, "");

    auto group = engine_->get_group("C");
    ASSERT_TRUE(group);
    EXPECT_THAT(group->members, ElementsAre("A", "B", "C"));
}

TEST_F(CorrelationEngineTest, ManualCorrelationWithUnknownIncidentChangesNothing) {
    submit(make_incident("A", "Checkout latency", 0));

    EXPECT_THROW(engine_->manual_correlate({"A", "ghost"}, "x"), IncidentNotFoundError);

    auto stats = engine_->get_stats();
    EXPECT_EQ(0u, stats.total_groups);
    EXPECT_EQ(0u, stats.total_correlations);
    EXPECT_FALSE(engine_->get_group("A"));
}

TEST_F(CorrelationEngineTest, ManualCorrelationNeedsTwoDistinctIncidents) {
    submit(make_incident("A", "Checkout latency", 0));

    EXPECT_THROW(engine_->manual_correlate({"A"}, "x"), CorrelationError);
    EXPECT_THROW(engine_->manual_correlate({"A", "A"}, "x"), CorrelationError);
}

TEST_F(CorrelationEngineTest, ResolveGroup) {
    submit(make_incident("A", "Database connection pool exhausted", 0));
    auto result = submit(make_incident("B", "Database connection pool full", 15));
    ASSERT_TRUE(result.group_id);

    engine_->resolve_group(*result.group_id);

    auto resolved = engine_->list_groups(GroupStatus::Resolved);
    ASSERT_EQ(1u, resolved.size());
    EXPECT_EQ(*result.group_id, resolved[0].id);
    EXPECT_TRUE(engine_->list_groups(GroupStatus::Active).empty());
    EXPECT_THROW(engine_->resolve_group("missing"), GroupNotFoundError);
}

TEST_F(CorrelationEngineTest, GroupLookupById) {
    submit(make_incident("A", "Database connection pool exhausted", 0));
    auto result = submit(make_incident("B", "Database connection pool full", 15));
    ASSERT_TRUE(result.group_id);

    auto group = engine_->get_group_by_id(*result.group_id);
    ASSERT_TRUE(group);
    EXPECT_THAT(group->members, ElementsAre("A", "B"));
    EXPECT_EQ("Correlated: Database connection pool exhausted", group->title);
    EXPECT_FALSE(engine_->get_group_by_id("no-such-group"));
}

TEST_F(CorrelationEngineTest, StatsReflectEngineState) {
    submit(make_incident("A", "Database connection pool exhausted", 0));
    auto result = submit(make_incident("B", "Database connection pool full", 15));

    auto stats = engine_->get_stats();
    EXPECT_EQ(1u, stats.total_groups);
    EXPECT_EQ(1u, stats.active);
    EXPECT_EQ(0u, stats.stable);
    EXPECT_EQ(0u, stats.resolved);
    EXPECT_EQ(2u, stats.mapped_incidents);
    EXPECT_EQ(result.correlations.size(), stats.total_correlations);
    EXPECT_EQ(2u, stats.dedup_entries);
}

TEST_F(CorrelationEngineTest, CorrelationDisabledStillDeduplicates) {
    config_.correlation_enabled = false;
    SetUp();

    submit(make_incident("A", "Database connection pool exhausted", 0));
    auto result = submit(make_incident("B", "Database connection pool full", 15));
    EXPECT_TRUE(result.correlations.empty());
    EXPECT_FALSE(result.group_id);

    auto dup = submit(make_incident("C", "Database connection pool full", 20));
    EXPECT_TRUE(dup.dedup.is_duplicate());
}

TEST_F(CorrelationEngineTest, SameSourceCandidateFilter) {
    config_.same_source_candidates_only = true;
    SetUp();

    submit(make_incident("A", "Database connection pool exhausted", 0, "datadog"));
    auto result = submit(make_incident("B", "Database connection pool exhausted", 15, "prometheus"));

    EXPECT_TRUE(result.correlations.empty());
}

TEST_F(CorrelationEngineTest, AnalyzeFillsMissingFingerprint) {
    auto result = submit(make_incident("A", "Disk full on /var", 0));
    EXPECT_EQ(DedupOutcome::New, result.dedup.outcome);
    EXPECT_EQ(1u, engine_->get_stats().dedup_entries);
}

TEST_F(CorrelationEngineTest, MaintenanceStabilizesQuietGroups) {
    submit(make_incident("A", "Database connection pool exhausted", 0));
    submit(make_incident("B", "Database connection pool full", 15));

    clock_.advance(std::chrono::seconds(config_.stabilize_after_secs + 1));
    auto report = engine_->run_maintenance();

    EXPECT_EQ(1u, report.stabilized);
    EXPECT_EQ(1u, engine_->list_groups(GroupStatus::Stable).size());
}

TEST_F(CorrelationEngineTest, InvalidConfigurationIsRejected) {
    Config bad;
    bad.max_group_size = 0;
    EXPECT_THROW({ CorrelationEngine engine(bad, store_); }, InvalidConfigError);

    bad = Config();
    bad.merge_threshold = 1.5;
    EXPECT_THROW({ CorrelationEngine engine(bad, store_); }, InvalidConfigError);
}

TEST_F(CorrelationEngineTest, SchedulerLifecycle) {
    EXPECT_FALSE(engine_->is_running());
    engine_->start();
    EXPECT_TRUE(engine_->is_running());
    engine_->stop();
    EXPECT_FALSE(engine_->is_running());
}
