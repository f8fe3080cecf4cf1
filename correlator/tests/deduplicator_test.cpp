#include <gtest/gtest.h>
#include "deduplicator.hpp"
#include "test_helpers.hpp"

class DeduplicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.dedup_window_secs = 900;
        dedup_ = std::make_unique<Deduplicator>(config_, store_);
    }

    Incident alert(const std::string& id) {
        return make_incident(id, "CPU usage above 90%");
    }

    Config config_;
    InMemoryIncidentStore store_;
    std::unique_ptr<Deduplicator> dedup_;
};

TEST_F(DeduplicatorTest, FirstSubmissionIsNew) {
    auto result = dedup_->check_and_record(alert("a-1"), base_time());

    EXPECT_EQ(DedupOutcome::New, result.outcome);
    EXPECT_TRUE(result.existing_id.empty());
    EXPECT_EQ(1u, dedup_->size());
}

TEST_F(DeduplicatorTest, RepeatWithinWindowIsDuplicate) {
    dedup_->check_and_record(alert("a-1"), base_time());
    auto result = dedup_->check_and_record(alert("a-2"), base_time() + std::chrono::seconds(60));

    ASSERT_TRUE(result.is_duplicate());
    EXPECT_EQ("a-1", result.existing_id);
    EXPECT_EQ(1u, result.occurrences);

    auto timeline = store_.timeline("a-1");
    ASSERT_EQ(1u, timeline.size());
    EXPECT_EQ("a-2", timeline[0].duplicate_id);
    EXPECT_EQ(1u, timeline[0].occurrence);
}

TEST_F(DeduplicatorTest, NSubmissionsRecordNMinusOneOccurrences) {
    const int submissions = 5;
    DedupResult last;
    for (int i = 0; i < submissions; ++i) {
        last = dedup_->check_and_record(alert("a-" + std::to_string(i)),
                                        base_time() + std::chrono::seconds(30 * i));
    }

    EXPECT_TRUE(last.is_duplicate());
    EXPECT_EQ("a-0", last.existing_id);
    EXPECT_EQ(static_cast<uint64_t>(submissions - 1), last.occurrences);
    EXPECT_EQ(static_cast<size_t>(submissions - 1), store_.occurrence_count("a-0"));
}

TEST_F(DeduplicatorTest, WindowBoundaryIsInclusive) {
    dedup_->check_and_record(alert("a-1"), base_time());
    auto result = dedup_->check_and_record(alert("a-2"), base_time() + std::chrono::seconds(900));

    EXPECT_TRUE(result.is_duplicate());
}

TEST_F(DeduplicatorTest, SubmissionAfterExpiryIsNew) {
    dedup_->check_and_record(alert("a-1"), base_time());
    auto result = dedup_->check_and_record(alert("a-2"), base_time() + std::chrono::seconds(901));

    EXPECT_EQ(DedupOutcome::New, result.outcome);

    // The later incident now holds the fingerprint
    auto next = dedup_->check_and_record(alert("a-3"), base_time() + std::chrono::seconds(902));
    ASSERT_TRUE(next.is_duplicate());
    EXPECT_EQ("a-2", next.existing_id);
}

TEST_F(DeduplicatorTest, DuplicatesExtendTheWindow) {
    dedup_->check_and_record(alert("a-1"), base_time());
    dedup_->check_and_record(alert("a-2"), base_time() + std::chrono::seconds(800));
    auto result = dedup_->check_and_record(alert("a-3"), base_time() + std::chrono::seconds(1600));

    ASSERT_TRUE(result.is_duplicate());
    EXPECT_EQ("a-1", result.existing_id);
}

TEST_F(DeduplicatorTest, ResubmittingSameIncidentIsNotAnOccurrence) {
    dedup_->check_and_record(alert("a-1"), base_time());
    auto result = dedup_->check_and_record(alert("a-1"), base_time() + std::chrono::seconds(10));

    EXPECT_EQ(DedupOutcome::New, result.outcome);
    EXPECT_EQ(0u, store_.occurrence_count("a-1"));
}

TEST_F(DeduplicatorTest, DistinctAlertsDoNotCollide) {
    dedup_->check_and_record(alert("a-1"), base_time());
    auto result = dedup_->check_and_record(make_incident("b-1", "Memory leak detected"), base_time());

    EXPECT_EQ(DedupOutcome::New, result.outcome);
    EXPECT_EQ(2u, dedup_->size());
}

TEST_F(DeduplicatorTest, SweepDropsLapsedEntries) {
    dedup_->check_and_record(alert("a-1"), base_time());
    dedup_->check_and_record(make_incident("b-1", "Memory leak detected"), base_time() + std::chrono::seconds(600));

    EXPECT_EQ(1u, dedup_->sweep_expired(base_time() + std::chrono::seconds(1000)));
    EXPECT_EQ(1u, dedup_->size());
}

TEST_F(DeduplicatorTest, ForgetDropsEntriesOfDeletedIncidents) {
    dedup_->check_and_record(alert("a-1"), base_time());
    dedup_->check_and_record(make_incident("b-1", "Memory leak detected"), base_time());

    EXPECT_EQ(1u, dedup_->forget({"a-1"}));
    auto tracked = dedup_->tracked_incident_ids();
    ASSERT_EQ(1u, tracked.size());
    EXPECT_EQ("b-1", tracked[0]);
}
