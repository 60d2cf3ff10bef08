#pragma once

/// @file target_query.hpp
/// @brief Read-only queries over a Snapshot: ranking, lookup, listing, health.

#include "core/config.hpp"
#include "core/types.hpp"
#include "observatory/observability_engine.hpp"
#include "observatory/telescope_profile.hpp"
#include "pipeline/snapshot.hpp"
#include "scoring/priority_scorer.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace neoplan::pipeline
{
    /// @brief One entry of tonight's list.
    struct RankedTarget
    {
        target::Target                   target;
        observatory::ObservabilityResult observability;
        scoring::ScoreTerms              terms;
        f64                              score = 0.0;
        u32                              rank  = 0;     ///< 1-based position in the list
    };

    /// @brief Freshness of one provider as exposed by status().
    struct ProviderHealth
    {
        target::ProviderId                 id;
        std::optional<Instant>             last_success_at;
        std::optional<core::ProviderError> last_error;
        u32                                last_record_count    = 0;
        u32                                consecutive_failures = 0;
    };

    /// @brief Service health derived from the current Snapshot.
    struct HealthStatus
    {
        bool                        ready = false;      ///< A Snapshot has been published
        std::optional<Instant>      published_at;
        u64                         version = 0;
        bool                        stale = false;
        std::size_t                 target_count = 0;
        std::vector<ProviderHealth> providers;          ///< Ordered by provider priority
    };

    /// @brief Observable targets for a profile, best first.
    ///
    /// Ties in score are broken by ascending designation. Work is fanned out
    /// over worker tasks; the result does not depend on how it was split.
    /// @param limit Maximum entries returned, 0 for no limit.
    /// @throws core::InvalidProfileError if the profile fails validation.
    [[nodiscard]] std::vector<RankedTarget> rank(
        const SnapshotPtr& snapshot,
        const observatory::TelescopeProfile& profile,
        const core::ScoringWeights& weights,
        std::size_t limit,
        Instant now,
        const core::ObservabilityConfig& config = {}
    );

    /// @brief Target answering to a designation or alias (case-insensitive).
    [[nodiscard]] std::optional<target::Target> lookup(const SnapshotPtr& snapshot, std::string_view designation);

    /// @brief Every cached target, unfiltered, in Snapshot order.
    /// @param limit Maximum entries returned, 0 for no limit.
    [[nodiscard]] std::vector<target::Target> list_targets(const SnapshotPtr& snapshot, std::size_t limit = 0);

    /// @brief Targets a given provider contributed to.
    [[nodiscard]] std::vector<target::Target> targets_from(const SnapshotPtr& snapshot, target::ProviderId provider);

    /// @brief Health summary; `ready` is false while nothing has been published.
    [[nodiscard]] HealthStatus status(const SnapshotPtr& snapshot);

} // namespace neoplan::pipeline
