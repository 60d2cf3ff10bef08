#pragma once

/// @file snapshot.hpp
/// @brief Immutable published state: merged targets plus per-source freshness.

#include "core/errors.hpp"
#include "core/types.hpp"
#include "target/target.hpp"

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace neoplan::pipeline
{
    /// @brief Freshness of one provider as of the cycle that produced a Snapshot.
    struct SourceStatus
    {
        std::optional<Instant>             last_success_at;
        std::optional<core::ProviderError> last_error;      ///< Cleared by the next success
        std::optional<Instant>             last_attempt_at;
        u32                                last_record_count    = 0;
        u32                                consecutive_failures = 0;

        bool operator==(const SourceStatus&) const = default;
    };

    using TargetList = std::vector<target::Target>;

    /// @brief One published generation of the target set.
    ///
    /// Never mutated once shared. `targets` is itself shared so that a
    /// metadata-only re-publish keeps the exact same target collection.
    struct Snapshot
    {
        u64                                           version = 0;
        Instant                                       published_at{};
        bool                                          stale = false;
        std::shared_ptr<const TargetList>             targets = std::make_shared<const TargetList>();
        std::map<target::ProviderId, SourceStatus>    sources;

        [[nodiscard]] std::size_t size() const { return targets->size(); }

        /// @brief Freshness of a provider, or std::nullopt if it was never polled.
        [[nodiscard]] std::optional<SourceStatus> source(target::ProviderId id) const;
    };

    using SnapshotPtr = std::shared_ptr<const Snapshot>;

} // namespace neoplan::pipeline
