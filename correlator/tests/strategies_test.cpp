#include <gtest/gtest.h>
#include "similarity.hpp"
#include "strategies.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <stdexcept>

namespace {

class ThrowingTopology : public TopologyProvider {
public:
    std::optional<uint32_t> hops(const std::string&, const std::string&, uint32_t) override {
        throw std::runtime_error("topology service unavailable");
    }
};

}

TEST(SimilarityTest, JaccardOverWordSets) {
    EXPECT_DOUBLE_EQ(1.0, similarity::jaccard("Disk Full", "disk  full"));
    EXPECT_DOUBLE_EQ(0.6, similarity::jaccard("Database connection pool exhausted",
                                              "Database connection pool full"));
    EXPECT_DOUBLE_EQ(0.0, similarity::jaccard("alpha", "beta"));
    EXPECT_DOUBLE_EQ(0.0, similarity::jaccard("", ""));
}

TEST(SimilarityTest, Levenshtein) {
    EXPECT_EQ(3u, similarity::levenshtein_distance("kitten", "sitting"));
    EXPECT_EQ(0u, similarity::levenshtein_distance("same", "same"));
    EXPECT_EQ(4u, similarity::levenshtein_distance("", "four"));
    EXPECT_DOUBLE_EQ(1.0, similarity::levenshtein_ratio("", ""));
    EXPECT_NEAR(1.0 - 3.0 / 7.0, similarity::levenshtein_ratio("kitten", "sitting"), 1e-12);
}

class StrategyEvaluatorTest : public ::testing::Test {
protected:
    StrategyEvaluator evaluator() {
        return StrategyEvaluator(config_, topology_);
    }

    Config config_;
    TopologyProvider* topology_ = nullptr;
};

TEST_F(StrategyEvaluatorTest, TemporalDecaysToFloorAtWindowEdge) {
    auto eval = evaluator();
    auto a = make_incident("a", "x", 0);

    auto same_time = eval.score_temporal(a, make_incident("b", "y", 0));
    ASSERT_TRUE(same_time);
    EXPECT_DOUBLE_EQ(1.0, same_time->score);

    auto edge = eval.score_temporal(a, make_incident("b", "y", 300));
    ASSERT_TRUE(edge);
    EXPECT_NEAR(0.05, edge->score, 1e-9);

    auto fifteen = eval.score_temporal(a, make_incident("b", "y", 15));
    ASSERT_TRUE(fifteen);
    EXPECT_NEAR(std::exp(std::log(0.05) * 15.0 / 300.0), fifteen->score, 1e-9);

    // Order of the pair does not matter
    auto reversed = eval.score_temporal(make_incident("b", "y", 15), a);
    ASSERT_TRUE(reversed);
    EXPECT_DOUBLE_EQ(fifteen->score, reversed->score);
}

TEST_F(StrategyEvaluatorTest, TemporalOutsideWindowIsAbsent) {
    auto eval = evaluator();
    auto a = make_incident("a", "x", 0);
    EXPECT_FALSE(eval.score_temporal(a, make_incident("b", "y", 301)));

    // Created 20 minutes apart; resolution times play no part
    auto first = make_incident("a", "x", 0);
    first.resolved_at = first.created_at + std::chrono::minutes(10);
    auto second = make_incident("b", "y", 20 * 60);
    second.resolved_at = second.created_at + std::chrono::minutes(5);
    EXPECT_FALSE(eval.score_temporal(first, second));
}

TEST_F(StrategyEvaluatorTest, PatternIdenticalIncidentsClampToOne) {
    auto eval = evaluator();
    auto a = make_incident("a", "Disk full on /var");
    a.description = "Filesystem /var reached 100% usage";
    auto b = a;
    b.id = "b";

    auto result = eval.score_pattern(a, b);
    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(1.0, result->score);
}

TEST_F(StrategyEvaluatorTest, PatternUsesLevenshteinForBorderlineTitles) {
    auto eval = evaluator();
    auto a = make_incident("a", "Database connection pool exhausted");
    auto b = make_incident("b", "Database connection pool full");

    // Title overlap 0.6 sits in the tie-break band and the edit ratio passes
    auto result = eval.score_pattern(a, b);
    ASSERT_TRUE(result);
    EXPECT_NEAR(0.6 * 0.6 + 0.05 + 0.05, result->score, 1e-9);
}

TEST_F(StrategyEvaluatorTest, PatternPrefilterRejectsUnrelatedText) {
    auto eval = evaluator();
    auto a = make_incident("a", "Disk full on /var");
    auto b = make_incident("b", "TLS certificate expiring");

    EXPECT_FALSE(eval.score_pattern(a, b));
}

TEST_F(StrategyEvaluatorTest, PatternDescriptionCanCarryThePair) {
    auto eval = evaluator();
    auto a = make_incident("a", "Checkout errors");
    a.description = "Connection refused on port 5432";
    auto b = make_incident("b", "Payment timeouts");
    b.description = a.description;

    auto result = eval.score_pattern(a, b);
    ASSERT_TRUE(result);
    EXPECT_NEAR(0.3 + 0.05 + 0.05, result->score, 1e-9);
}

TEST_F(StrategyEvaluatorTest, PatternBonusesNeedExactMatches) {
    auto eval = evaluator();
    auto a = make_incident("a", "Disk full on /var");
    a.category.clear();
    auto b = a;
    b.id = "b";
    b.severity = Severity::P0;

    auto result = eval.score_pattern(a, b);
    ASSERT_TRUE(result);
    EXPECT_NEAR(0.6, result->score, 1e-9);
}

TEST_F(StrategyEvaluatorTest, SourceRequiresExactMatch) {
    auto eval = evaluator();
    auto a = make_incident("a", "x", 0, "datadog");

    EXPECT_FALSE(eval.score_source(a, make_incident("b", "y", 0, "prometheus")));
    EXPECT_FALSE(eval.score_source(a, make_incident("b", "y", 0, "Datadog")));

    auto same = eval.score_source(a, make_incident("b", "y", 0, "datadog"));
    ASSERT_TRUE(same);
    EXPECT_DOUBLE_EQ(1.0, same->score);

    auto later = eval.score_source(a, make_incident("b", "y", 600, "datadog"));
    ASSERT_TRUE(later);
    EXPECT_NEAR(std::exp(-1.0), later->score, 1e-9);
}

TEST_F(StrategyEvaluatorTest, SourceScaledByMatchWeight) {
    config_.source_match_weight = 0.5;
    auto eval = evaluator();

    auto result = eval.score_source(make_incident("a", "x"), make_incident("b", "y"));
    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(0.5, result->score);
}

TEST_F(StrategyEvaluatorTest, FingerprintRequiresEqualNonEmptyValues) {
    auto eval = evaluator();
    auto a = make_incident("a", "x");
    auto b = make_incident("b", "x");

    EXPECT_FALSE(eval.score_fingerprint(a, b));

    a.fingerprint = b.fingerprint = "abc123";
    auto match = eval.score_fingerprint(a, b);
    ASSERT_TRUE(match);
    EXPECT_DOUBLE_EQ(1.0, match->score);

    b.fingerprint = "def456";
    EXPECT_FALSE(eval.score_fingerprint(a, b));
}

TEST_F(StrategyEvaluatorTest, TopologyDecaysWithHops) {
    std::vector<std::pair<std::string, std::string>> edges = {
        {"lb", "api"}, {"api", "db"}, {"db", "disk"}, {"disk", "array"}
    };
    StaticTopologyProvider provider(edges);
    topology_ = &provider;
    config_.enable_topology = true;
    config_.topology_max_hops = 3;
    auto eval = evaluator();

    auto a = make_incident("a", "x");
    auto b = make_incident("b", "y");

    a.resource.id = b.resource.id = "api";
    auto same = eval.score_topology(a, b);
    ASSERT_TRUE(same);
    EXPECT_DOUBLE_EQ(1.0, same->score);

    a.resource.id = "lb";
    b.resource.id = "db";
    auto two_hops = eval.score_topology(a, b);
    ASSERT_TRUE(two_hops);
    EXPECT_DOUBLE_EQ(0.5, two_hops->score);

    b.resource.id = "array";
    EXPECT_FALSE(eval.score_topology(a, b));

    b.resource.id = "unknown";
    EXPECT_FALSE(eval.score_topology(a, b));
}

TEST_F(StrategyEvaluatorTest, TopologyWithoutProviderIsAbsent) {
    config_.enable_topology = true;
    auto eval = evaluator();

    EXPECT_FALSE(eval.score_topology(make_incident("a", "x"), make_incident("b", "y")));
}

TEST_F(StrategyEvaluatorTest, TopologyFailureSkipsOnlyThatStrategy) {
    ThrowingTopology provider;
    topology_ = &provider;
    config_.enable_topology = true;
    auto eval = evaluator();

    auto scores = eval.evaluate(make_incident("a", "x", 0), make_incident("b", "y", 10));

    EXPECT_EQ(nullptr, scores.find(StrategyKind::Topology));
    EXPECT_NE(nullptr, scores.find(StrategyKind::Temporal));
    EXPECT_NE(nullptr, scores.find(StrategyKind::Source));
    EXPECT_TRUE(scores.combined);
}

TEST_F(StrategyEvaluatorTest, DisabledStrategiesDoNotSignal) {
    config_.enable_source = false;
    config_.enable_temporal = false;
    auto eval = evaluator();

    auto scores = eval.evaluate(make_incident("a", "x", 0), make_incident("b", "y", 10));

    EXPECT_TRUE(scores.signals.empty());
    EXPECT_FALSE(scores.combined);
}

TEST_F(StrategyEvaluatorTest, CombineWeightsPresentSignalsOnly) {
    EXPECT_FALSE(StrategyEvaluator::combine({}));

    auto single = StrategyEvaluator::combine({{StrategyKind::Temporal, 0.5, "t"}});
    ASSERT_TRUE(single);
    EXPECT_DOUBLE_EQ(0.5, single->score);

    auto pair = StrategyEvaluator::combine({{StrategyKind::Temporal, 0.4, "t"}, {StrategyKind::Source, 0.3, "s"}});
    ASSERT_TRUE(pair);
    EXPECT_NEAR((0.3 * 0.4 + 0.2 * 0.3) / 0.5 * 1.2, pair->score, 1e-9);
    EXPECT_EQ(StrategyKind::Combined, pair->kind);
}

TEST_F(StrategyEvaluatorTest, CombinedBoostIsClamped) {
    auto combined = StrategyEvaluator::combine({
        {StrategyKind::Temporal, 1.0, "t"},
        {StrategyKind::Pattern, 0.95, "p"},
        {StrategyKind::Fingerprint, 1.0, "f"}
    });
    ASSERT_TRUE(combined);
    EXPECT_DOUBLE_EQ(1.0, combined->score);
}

TEST_F(StrategyEvaluatorTest, AllScoresStayInUnitInterval) {
    config_.source_match_weight = 1.0;
    auto eval = evaluator();

    std::vector<Incident> incidents = {
        make_incident("a", "Database connection pool exhausted", 0),
        make_incident("b", "Database connection pool full", 15),
        make_incident("c", "Database connection pool exhausted", 299),
        make_incident("d", "Disk full", 120, "prometheus"),
    };
    for (auto& incident : incidents) {
        incident.fingerprint = "same";
    }

    for (size_t i = 0; i < incidents.size(); ++i) {
        for (size_t j = 0; j < incidents.size(); ++j) {
            if (i == j) continue;
            auto scores = eval.evaluate(incidents[i], incidents[j]);
            for (const auto& signal : scores.signals) {
                EXPECT_GE(signal.score, 0.0);
                EXPECT_LE(signal.score, 1.0);
            }
            if (scores.combined) {
                EXPECT_GE(scores.combined->score, 0.0);
                EXPECT_LE(scores.combined->score, 1.0);
            }
        }
    }
}

TEST_F(StrategyEvaluatorTest, MinimumScoreFallsBackToGlobal) {
    config_.min_correlation_score = 0.4;
    config_.min_score_pattern = 0.25;
    auto eval = evaluator();

    EXPECT_DOUBLE_EQ(0.25, eval.minimum_score(StrategyKind::Pattern));
    EXPECT_DOUBLE_EQ(0.4, eval.minimum_score(StrategyKind::Temporal));
    EXPECT_DOUBLE_EQ(0.4, eval.minimum_score(StrategyKind::Combined));
}
