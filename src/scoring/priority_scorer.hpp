#pragma once

/// @file priority_scorer.hpp
/// @brief Scientific value and urgency score of an observable target.

#include "core/config.hpp"
#include "core/types.hpp"
#include "observatory/observability_engine.hpp"
#include "target/target.hpp"

#include <string_view>

namespace neoplan::scoring
{
    /// @brief Individual priority terms, each normalized to [0, 1].
    ///
    /// An absent input yields 0 for its term.
    struct ScoreTerms
    {
        f64 urgency       = 0.0;   ///< not_seen_days / 7
        f64 orbit         = 0.0;   ///< floor / max(arc_days, floor)
        f64 neo           = 0.0;   ///< neo_score / 100
        f64 pha           = 0.0;   ///< pha_score / 100
        f64 impact        = 0.0;   ///< (log10 p + 9) / 7
        f64 observability = 0.0;   ///< obs_window_hours / 6
        f64 brightness    = 0.0;   ///< magnitude_margin / 5
    };

    /// @brief Weighted combination of ScoreTerms.
    ///
    /// score = 100 · Σ(wᵢ·tᵢ) / Σwᵢ, or 0 when Σwᵢ ≤ 0. Terms are summed in
    /// declaration order so identical inputs give bit-identical scores.
    class PriorityScorer
    {
    public:
        PriorityScorer() = delete;

        /// @brief Normalized terms for one target.
        [[nodiscard]] static ScoreTerms terms(
            const target::Target& target,
            const observatory::ObservabilityResult& result,
            const core::ScoringWeights& weights = {}
        );

        /// @brief Combine precomputed terms.
        [[nodiscard]] static f64 combine(const ScoreTerms& terms, const core::ScoringWeights& weights = {});

        /// @brief Priority score in [0, 100].
        [[nodiscard]] static f64 score(
            const target::Target& target,
            const observatory::ObservabilityResult& result,
            const core::ScoringWeights& weights = {}
        );

        /// @brief Rank order: higher score first, then ascending designation.
        [[nodiscard]] static bool ranks_before(f64 score_a, std::string_view designation_a,
                                               f64 score_b, std::string_view designation_b);
    };

} // namespace neoplan::scoring
