#pragma once

#include "config.hpp"
#include "topology.hpp"
#include "types.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

// Evaluation order of the pairwise strategies. Fixed so that combined scores
// and the records emitted for a pair are reproducible.
constexpr std::array<StrategyKind, 5> PAIRWISE_STRATEGIES = {
    StrategyKind::Temporal,
    StrategyKind::Pattern,
    StrategyKind::Source,
    StrategyKind::Fingerprint,
    StrategyKind::Topology
};

struct StrategySignal {
    StrategyKind kind;
    double score;
    std::string reason;
};

struct StrategyScores {
    std::vector<StrategySignal> signals;  // strategies that produced a score, in evaluation order
    std::optional<StrategySignal> combined;

    const StrategySignal* find(StrategyKind kind) const;
};

class StrategyEvaluator {
public:
    // topology may be null; the topology strategy then never signals
    StrategyEvaluator(const Config& config, TopologyProvider* topology);

    // Run every enabled strategy in order, then combine
    StrategyScores evaluate(const Incident& a, const Incident& b) const;

    // Dispatch a single pairwise strategy. nullopt means the pair is out of
    // scope for that strategy, which is distinct from a computed zero.
    std::optional<StrategySignal> score(StrategyKind kind, const Incident& a, const Incident& b) const;

    bool is_enabled(StrategyKind kind) const;

    // Minimum score for a record of this strategy to be emitted
    double minimum_score(StrategyKind kind) const;

    // Individual strategies
    std::optional<StrategySignal> score_temporal(const Incident& a, const Incident& b) const;
    std::optional<StrategySignal> score_pattern(const Incident& a, const Incident& b) const;
    std::optional<StrategySignal> score_source(const Incident& a, const Incident& b) const;
    std::optional<StrategySignal> score_fingerprint(const Incident& a, const Incident& b) const;
    std::optional<StrategySignal> score_topology(const Incident& a, const Incident& b) const;

    // Weighted mean over present signals, boosted when more than one strategy
    // signalled, clamped to [0, 1]. nullopt when no signals are present.
    static std::optional<StrategySignal> combine(const std::vector<StrategySignal>& signals);

    static double weight(StrategyKind kind);

    // Decay rate placing the temporal score at `floor` on the window edge
    static double temporal_decay_rate(uint64_t window_secs, double floor);

    static constexpr double TITLE_WEIGHT = 0.6;
    static constexpr double DESCRIPTION_WEIGHT = 0.3;
    static constexpr double SEVERITY_MATCH_BONUS = 0.05;
    static constexpr double CATEGORY_MATCH_BONUS = 0.05;
    static constexpr double TITLE_AMBIGUITY_BAND = 0.1;
    static constexpr double MULTI_SIGNAL_BOOST = 1.2;

private:
    static double elapsed_seconds(const Incident& a, const Incident& b);

    const Config& config_;
    TopologyProvider* topology_;
};
