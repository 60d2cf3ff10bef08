/// @file target_query.cpp
/// @brief Snapshot queries and the parallel ranking fan-out.

#include "pipeline/target_query.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <functional>
#include <future>
#include <iterator>
#include <thread>

namespace neoplan::pipeline
{

namespace
{

/// Smallest number of targets worth a worker task of its own.
constexpr std::size_t kMinChunk = 32;

std::vector<RankedTarget> evaluate_chunk(const TargetList& targets,
                                         std::size_t begin, std::size_t end,
                                         const observatory::TelescopeProfile& profile,
                                         const std::optional<observatory::TimeWindow>& dark,
                                         const core::ScoringWeights& weights,
                                         const core::ObservabilityConfig& config)
{
    std::vector<RankedTarget> out;
    for (std::size_t i = begin; i < end; ++i)
    {
        const target::Target& t = targets[i];
        auto result = observatory::ObservabilityEngine::evaluate_in_window(t, profile, dark, config);
        if (!result.observable)
        {
            continue;
        }

        RankedTarget entry;
        entry.target = t;
        entry.terms = scoring::PriorityScorer::terms(t, result, weights);
        entry.score = scoring::PriorityScorer::combine(entry.terms, weights);
        entry.observability = std::move(result);
        out.push_back(std::move(entry));
    }
    return out;
}

} // anonymous namespace

// -----------------------------------------------------------------
// rank
//
// One dark window per call. Per-target stages run in parallel chunks,
// gathered in chunk order before the final sort.
// -----------------------------------------------------------------

std::vector<RankedTarget> rank(const SnapshotPtr& snapshot,
                               const observatory::TelescopeProfile& profile,
                               const core::ScoringWeights& weights,
                               std::size_t limit,
                               Instant now,
                               const core::ObservabilityConfig& config)
{
    if (const auto problem = observatory::validate_profile(profile))
    {
        NPL_WARN("rank: rejecting profile '{}': {}", profile.name, *problem);
        throw core::InvalidProfileError("invalid telescope profile: " + *problem);
    }

    std::vector<RankedTarget> ranked;
    if (!snapshot || snapshot->targets->empty())
    {
        return ranked;
    }

    const TargetList& targets = *snapshot->targets;
    const auto dark = observatory::ObservabilityEngine::dark_window(profile, now, config);

    const std::size_t workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    const std::size_t chunk = std::max(kMinChunk, (targets.size() + workers - 1) / workers);

    std::vector<std::future<std::vector<RankedTarget>>> pending;
    for (std::size_t begin = 0; begin < targets.size(); begin += chunk)
    {
        const std::size_t end = std::min(targets.size(), begin + chunk);
        pending.push_back(std::async(std::launch::async, evaluate_chunk,
                                     std::cref(targets), begin, end,
                                     std::cref(profile), std::cref(dark),
                                     std::cref(weights), std::cref(config)));
    }

    for (auto& f : pending)
    {
        auto part = f.get();
        ranked.insert(ranked.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedTarget& a, const RankedTarget& b) {
        return scoring::PriorityScorer::ranks_before(a.score, a.target.designation,
                                                     b.score, b.target.designation);
    });

    if (limit > 0 && ranked.size() > limit)
    {
        ranked.resize(limit);
    }
    for (std::size_t i = 0; i < ranked.size(); ++i)
    {
        ranked[i].rank = static_cast<u32>(i + 1);
    }

    NPL_TRACE("rank: {} of {} targets observable from '{}'", ranked.size(), targets.size(), profile.name);
    return ranked;
}

std::optional<target::Target> lookup(const SnapshotPtr& snapshot, std::string_view designation)
{
    if (!snapshot)
    {
        return std::nullopt;
    }

    const TargetList& targets = *snapshot->targets;

    // Exact designation first, aliases second.
    const auto by_designation = std::find_if(targets.begin(), targets.end(), [designation](const target::Target& t) {
        return target::iequals(t.designation, designation);
    });
    if (by_designation != targets.end())
    {
        return *by_designation;
    }

    const auto by_alias = std::find_if(targets.begin(), targets.end(), [designation](const target::Target& t) {
        return target::answers_to(t, designation);
    });
    if (by_alias != targets.end())
    {
        return *by_alias;
    }
    return std::nullopt;
}

std::vector<target::Target> list_targets(const SnapshotPtr& snapshot, std::size_t limit)
{
    if (!snapshot)
    {
        return {};
    }
    const TargetList& targets = *snapshot->targets;
    const std::size_t n = limit > 0 ? std::min(limit, targets.size()) : targets.size();
    return std::vector<target::Target>(targets.begin(), targets.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<target::Target> targets_from(const SnapshotPtr& snapshot, target::ProviderId provider)
{
    std::vector<target::Target> out;
    if (!snapshot)
    {
        return out;
    }
    std::copy_if(snapshot->targets->begin(), snapshot->targets->end(), std::back_inserter(out),
                 [provider](const target::Target& t) { return t.contributing_sources.contains(provider); });
    return out;
}

HealthStatus status(const SnapshotPtr& snapshot)
{
    HealthStatus health;
    if (!snapshot)
    {
        return health;
    }

    health.ready = true;
    health.published_at = snapshot->published_at;
    health.version = snapshot->version;
    health.stale = snapshot->stale;
    health.target_count = snapshot->size();

    for (const auto& [id, source] : snapshot->sources)
    {
        health.providers.push_back(ProviderHealth{
            .id                   = id,
            .last_success_at      = source.last_success_at,
            .last_error           = source.last_error,
            .last_record_count    = source.last_record_count,
            .consecutive_failures = source.consecutive_failures,
        });
    }
    return health;
}

} // namespace neoplan::pipeline
