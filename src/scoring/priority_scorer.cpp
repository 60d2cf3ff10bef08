/// @file priority_scorer.cpp
/// @brief Term normalization and weighted combination.

#include "scoring/priority_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace neoplan::scoring
{

namespace
{

f64 clamp01(f64 x)
{
    return std::clamp(x, 0.0, 1.0);
}

} // anonymous namespace

// -----------------------------------------------------------------
// Term normalization
//
//   urgency       = clamp(not_seen / 7 d)
//   orbit         = floor / max(arc, floor)              (∝ 1/arc)
//   neo, pha      = clamp(score / 100)
//   impact        = clamp((log10 p + 9) / 7),  p > 0     (1e-9 → 0, 1e-2 → 1)
//   observability = clamp(hours / 6 h)
//   brightness    = clamp(margin / 5 mag)
// -----------------------------------------------------------------

ScoreTerms PriorityScorer::terms(const target::Target& target,
                                 const observatory::ObservabilityResult& result,
                                 const core::ScoringWeights& weights)
{
    ScoreTerms t;

    if (target.not_seen_days)
    {
        t.urgency = clamp01(*target.not_seen_days / 7.0);
    }
    if (target.arc_days)
    {
        const f64 floor = weights.arc_floor_days;
        t.orbit = clamp01(floor / std::max(*target.arc_days, floor));
    }
    if (target.neo_score)
    {
        t.neo = clamp01(*target.neo_score / 100.0);
    }
    if (target.pha_score)
    {
        t.pha = clamp01(*target.pha_score / 100.0);
    }
    if (target.impact_prob && *target.impact_prob > 0.0)
    {
        t.impact = clamp01((std::log10(*target.impact_prob) + 9.0) / 7.0);
    }
    t.observability = clamp01(result.obs_window_hours / 6.0);
    if (result.magnitude_margin)
    {
        t.brightness = clamp01(*result.magnitude_margin / 5.0);
    }

    return t;
}

f64 PriorityScorer::combine(const ScoreTerms& terms, const core::ScoringWeights& weights)
{
    const f64 weighted = weights.urgency * terms.urgency
                       + weights.orbit * terms.orbit
                       + weights.neo * terms.neo
                       + weights.pha * terms.pha
                       + weights.impact * terms.impact
                       + weights.observability * terms.observability
                       + weights.brightness * terms.brightness;

    const f64 weight_sum = weights.urgency + weights.orbit + weights.neo + weights.pha
                         + weights.impact + weights.observability + weights.brightness;

    if (!(weight_sum > 0.0))
    {
        return 0.0;
    }
    return 100.0 * weighted / weight_sum;
}

f64 PriorityScorer::score(const target::Target& target,
                          const observatory::ObservabilityResult& result,
                          const core::ScoringWeights& weights)
{
    return combine(terms(target, result, weights), weights);
}

bool PriorityScorer::ranks_before(f64 score_a, std::string_view designation_a,
                                  f64 score_b, std::string_view designation_b)
{
    if (score_a != score_b)
    {
        return score_a > score_b;
    }
    return designation_a < designation_b;
}

} // namespace neoplan::scoring
