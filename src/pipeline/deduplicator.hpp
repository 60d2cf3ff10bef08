#pragma once

/// @file deduplicator.hpp
/// @brief Cross-source reconciliation of target reports into one record per object.

#include "core/config.hpp"
#include "core/types.hpp"
#include "pipeline/snapshot.hpp"
#include "target/target.hpp"

#include <set>
#include <vector>

namespace neoplan::pipeline
{
    /// @brief Output of one deduplication pass.
    struct DedupResult
    {
        TargetList targets;             ///< Merged targets, ordered by designation
        u32        ambiguities = 0;     ///< Rejected joins between incompatible clusters
        u32        retained    = 0;     ///< Previous targets carried forward unmatched
        u32        dropped     = 0;     ///< Previous targets no feed reports any more
    };

    /// @brief Merges duplicate reports of the same physical object.
    ///
    /// Two records describe the same object when
    ///   (a) they lie within `match_radius_arcsec` and their epochs within `epoch_window`,
    ///   (b) one lists the other's designation among its aliases, or
    ///   (c) they carry the same designation and share a contributing provider.
    /// Matches are transitive (union-find). A join is refused when it would put
    /// two fresh records of one provider with different designations into a
    /// single object; the larger side keeps its members, the refused record
    /// stays separate, and the event is counted as an ambiguity.
    ///
    /// Inputs are put in canonical order first, so the result does not depend
    /// on the order records arrive in.
    class Deduplicator
    {
    public:
        explicit Deduplicator(core::DedupConfig config = {});

        /// @brief Reconcile this cycle's records with the previous Snapshot's.
        /// @param fresh Records fetched this cycle.
        /// @param previous Targets of the previous Snapshot.
        /// @param failed_providers Providers whose fetch failed this cycle; an
        ///        unmatched previous target survives only if one of its sources failed.
        [[nodiscard]] DedupResult deduplicate(
            const std::vector<target::Target>& fresh,
            const std::vector<target::Target>& previous = {},
            const std::set<target::ProviderId>& failed_providers = {}
        ) const;

        /// @brief Merge records already known to describe one object.
        ///
        /// Each scalar takes the most recently updated present value (ties:
        /// provider priority, then designation, then the smaller value). The
        /// position triple comes whole from the record with the latest epoch.
        /// Identity comes from the highest-priority record.
        [[nodiscard]] static target::Target merge(const std::vector<target::Target>& records);

        /// @brief True if rule (a), (b) or (c) pairs the two records.
        [[nodiscard]] bool matches(const target::Target& a, const target::Target& b) const;

        [[nodiscard]] const core::DedupConfig& config() const { return m_config; }

    private:
        core::DedupConfig m_config;
    };

} // namespace neoplan::pipeline
