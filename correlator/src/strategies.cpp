#include "strategies.hpp"
#include "similarity.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

const StrategySignal* StrategyScores::find(StrategyKind kind) const {
    for (const auto& signal : signals) {
        if (signal.kind == kind) {
            return &signal;
        }
    }
    return nullptr;
}

StrategyEvaluator::StrategyEvaluator(const Config& config, TopologyProvider* topology)
    : config_(config), topology_(topology) {}

StrategyScores StrategyEvaluator::evaluate(const Incident& a, const Incident& b) const {
    StrategyScores result;

    for (StrategyKind kind : PAIRWISE_STRATEGIES) {
        if (!is_enabled(kind)) {
            continue;
        }
        auto signal = score(kind, a, b);
        if (signal) {
            result.signals.push_back(std::move(*signal));
        }
    }

    result.combined = combine(result.signals);
    return result;
}

std::optional<StrategySignal> StrategyEvaluator::score(StrategyKind kind, const Incident& a, const Incident& b) const {
    switch (kind) {
        case StrategyKind::Temporal: return score_temporal(a, b);
        case StrategyKind::Pattern: return score_pattern(a, b);
        case StrategyKind::Source: return score_source(a, b);
        case StrategyKind::Fingerprint: return score_fingerprint(a, b);
        case StrategyKind::Topology: return score_topology(a, b);
        case StrategyKind::Combined:
        case StrategyKind::Manual:
            break;
    }
    return std::nullopt;
}

bool StrategyEvaluator::is_enabled(StrategyKind kind) const {
    switch (kind) {
        case StrategyKind::Temporal: return config_.enable_temporal;
        case StrategyKind::Pattern: return config_.enable_pattern;
        case StrategyKind::Source: return config_.enable_source;
        case StrategyKind::Fingerprint: return config_.enable_fingerprint;
        case StrategyKind::Topology: return config_.enable_topology;
        case StrategyKind::Combined: return true;
        case StrategyKind::Manual: return true;
    }
    return false;
}

double StrategyEvaluator::minimum_score(StrategyKind kind) const {
    std::optional<double> specific;
    switch (kind) {
        case StrategyKind::Temporal: specific = config_.min_score_temporal; break;
        case StrategyKind::Pattern: specific = config_.min_score_pattern; break;
        case StrategyKind::Source: specific = config_.min_score_source; break;
        case StrategyKind::Fingerprint: specific = config_.min_score_fingerprint; break;
        case StrategyKind::Topology: specific = config_.min_score_topology; break;
        case StrategyKind::Manual: return 0.0;
        case StrategyKind::Combined: break;
    }
    return specific.value_or(config_.min_correlation_score);
}

std::optional<StrategySignal> StrategyEvaluator::score_temporal(const Incident& a, const Incident& b) const {
    double dt = elapsed_seconds(a, b);
    if (dt > static_cast<double>(config_.temporal_window_secs)) {
        return std::nullopt;
    }

    double decay_rate = temporal_decay_rate(config_.temporal_window_secs, config_.temporal_score_floor);
    double value = std::clamp(std::exp(-decay_rate * dt), 0.0, 1.0);

    return StrategySignal{
        StrategyKind::Temporal,
        value,
        fmt::format("Incidents occurred within {:.0f} seconds of each other", dt)
    };
}

std::optional<StrategySignal> StrategyEvaluator::score_pattern(const Incident& a, const Incident& b) const {
    const double threshold = config_.pattern_similarity_threshold;

    double title_sim = similarity::jaccard(a.title, b.title);
    double desc_sim = similarity::jaccard(a.description, b.description);

    // Levenshtein only settles titles whose token overlap sits just under the
    // threshold; it never feeds into the score
    bool title_passes = title_sim >= threshold;
    if (!title_passes && title_sim > 0.0 && title_sim >= threshold - TITLE_AMBIGUITY_BAND) {
        title_passes = similarity::levenshtein_ratio(util::normalize_text(a.title),
                                                     util::normalize_text(b.title)) >= threshold;
    }

    if (!title_passes && desc_sim < threshold) {
        return std::nullopt;
    }

    double value = TITLE_WEIGHT * title_sim + DESCRIPTION_WEIGHT * desc_sim;
    if (a.severity == b.severity) {
        value += SEVERITY_MATCH_BONUS;
    }
    if (!a.category.empty() && a.category == b.category) {
        value += CATEGORY_MATCH_BONUS;
    }
    value = std::clamp(value, 0.0, 1.0);

    return StrategySignal{
        StrategyKind::Pattern,
        value,
        fmt::format("Incidents have similar patterns (title: {:.2f}, description: {:.2f})", title_sim, desc_sim)
    };
}

std::optional<StrategySignal> StrategyEvaluator::score_source(const Incident& a, const Incident& b) const {
    if (a.source.empty() || a.source != b.source) {
        return std::nullopt;
    }

    double dt = elapsed_seconds(a, b);
    double decay_rate = 1.0 / static_cast<double>(config_.source_decay_secs);
    double value = std::clamp(config_.source_match_weight * std::exp(-decay_rate * dt), 0.0, 1.0);

    return StrategySignal{
        StrategyKind::Source,
        value,
        fmt::format("Incidents reported by the same source '{}' {:.0f} seconds apart", a.source, dt)
    };
}

std::optional<StrategySignal> StrategyEvaluator::score_fingerprint(const Incident& a, const Incident& b) const {
    if (a.fingerprint.empty() || a.fingerprint != b.fingerprint) {
        return std::nullopt;
    }

    return StrategySignal{
        StrategyKind::Fingerprint,
        1.0,
        fmt::format("Incidents share fingerprint {}", a.fingerprint.substr(0, 12))
    };
}

std::optional<StrategySignal> StrategyEvaluator::score_topology(const Incident& a, const Incident& b) const {
    if (!topology_ || a.resource.id.empty() || b.resource.id.empty()) {
        return std::nullopt;
    }

    std::optional<uint32_t> hops;
    try {
        hops = topology_->hops(a.resource.id, b.resource.id, config_.topology_max_hops);
    } catch (const std::exception& e) {
        spdlog::warn("Topology lookup failed for {} <-> {}: {}", a.resource.id, b.resource.id, e.what());
        return std::nullopt;
    }

    if (!hops || *hops > config_.topology_max_hops) {
        return std::nullopt;
    }

    // Linear decay: same resource scores 1, one hop past the bound would score 0
    double value = 1.0 - static_cast<double>(*hops) / static_cast<double>(config_.topology_max_hops + 1);
    value = std::clamp(value, 0.0, 1.0);

    return StrategySignal{
        StrategyKind::Topology,
        value,
        fmt::format("Resources {} and {} are {} hop(s) apart", a.resource.id, b.resource.id, *hops)
    };
}

std::optional<StrategySignal> StrategyEvaluator::combine(const std::vector<StrategySignal>& signals) {
    if (signals.empty()) {
        return std::nullopt;
    }

    double weighted_sum = 0.0;
    double weight_total = 0.0;
    std::vector<std::string> reasons;
    reasons.reserve(signals.size());

    for (const auto& signal : signals) {
        double w = weight(signal.kind);
        weighted_sum += w * signal.score;
        weight_total += w;
        reasons.push_back(fmt::format("{}: {}", to_string(signal.kind), signal.reason));
    }

    double value = weight_total > 0.0 ? weighted_sum / weight_total : 0.0;
    if (signals.size() > 1) {
        value *= MULTI_SIGNAL_BOOST;
    }
    value = std::clamp(value, 0.0, 1.0);

    return StrategySignal{StrategyKind::Combined, value, fmt::format("{}", fmt::join(reasons, "; "))};
}

double StrategyEvaluator::weight(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Temporal: return 0.3;
        case StrategyKind::Pattern: return 0.3;
        case StrategyKind::Source: return 0.2;
        case StrategyKind::Fingerprint: return 0.2;
        case StrategyKind::Topology: return 0.2;
        case StrategyKind::Combined:
        case StrategyKind::Manual:
            break;
    }
    return 0.0;
}

double StrategyEvaluator::temporal_decay_rate(uint64_t window_secs, double floor) {
    return -std::log(floor) / static_cast<double>(window_secs);
}

double StrategyEvaluator::elapsed_seconds(const Incident& a, const Incident& b) {
    auto diff = a.created_at > b.created_at ? a.created_at - b.created_at : b.created_at - a.created_at;
    return std::chrono::duration<double>(diff).count();
}
