/// @file refresh_orchestrator.cpp
/// @brief Refresh cycle implementation and background loop.

#include "pipeline/refresh_orchestrator.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "target/target.hpp"

#include <condition_variable>
#include <memory>
#include <set>
#include <string>
#include <thread>

namespace neoplan::pipeline
{

namespace
{

using providers::FetchResult;

/// Clears the in-flight flag and returns to Idle however the cycle ends.
class CycleGuard
{
public:
    CycleGuard(std::atomic<bool>& in_flight, std::atomic<CycleState>& state)
        : m_in_flight(in_flight)
        , m_state(state)
    {
    }

    ~CycleGuard()
    {
        m_state.store(CycleState::Idle);
        m_in_flight.store(false);
    }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

private:
    std::atomic<bool>&       m_in_flight;
    std::atomic<CycleState>& m_state;
};

/// Fold one fetch outcome into the provider's freshness record.
void update_status(SourceStatus& status, const FetchResult& result, Instant now)
{
    status.last_attempt_at = now;
    if (result.ok())
    {
        status.last_success_at = now;
        status.last_error.reset();
        status.last_record_count = static_cast<u32>(result.records.size());
        status.consecutive_failures = 0;
    }
    else
    {
        status.last_error = result.error;
        ++status.consecutive_failures;
    }
}

/// Attribute every record to its feed and move out-of-domain ones into `skipped`.
void admit_records(const providers::TargetProvider& provider, FetchResult& result)
{
    std::vector<target::Target> accepted;
    accepted.reserve(result.records.size());

    for (auto& record : result.records)
    {
        record.source = provider.id();
        record.contributing_sources = {provider.id()};

        if (const auto problem = target::validate_target(record))
        {
            NPL_CORE_WARN("RefreshOrchestrator: '{}' sent an invalid record '{}': {}",
                          provider.name(), record.designation, *problem);
            result.skipped.push_back(core::ProviderError{
                .kind    = core::ProviderErrorKind::Parse,
                .message = record.designation + ": " + *problem,
            });
            continue;
        }
        accepted.push_back(std::move(record));
    }

    result.records = std::move(accepted);
}

} // anonymous namespace

RefreshOrchestrator::RefreshOrchestrator(providers::ProviderRegistry registry,
                                         SnapshotStore& store,
                                         core::PipelineConfig config,
                                         TimeSource now)
    : m_registry(std::move(registry))
    , m_store(store)
    , m_config(std::move(config))
    , m_now(std::move(now))
    , m_deduplicator(m_config.dedup)
{
}

RefreshOrchestrator::~RefreshOrchestrator()
{
    stop();
}

void RefreshOrchestrator::start()
{
    if (m_thread.joinable())
    {
        NPL_CORE_WARN("RefreshOrchestrator: already running");
        return;
    }

    m_stop_requested.store(false);
    m_thread = std::jthread([this](std::stop_token stop_token) { loop(stop_token); });

    NPL_CORE_INFO("RefreshOrchestrator: started ({} providers, every {} s)",
                  m_registry.size(),
                  std::chrono::duration_cast<std::chrono::seconds>(m_config.refresh.interval).count());
}

void RefreshOrchestrator::stop()
{
    m_stop_requested.store(true);
    cancel_fetch_round();

    if (!m_thread.joinable())
    {
        return;
    }

    m_thread.request_stop();
    m_wait_cv.notify_all();
    m_thread.join();

    NPL_CORE_INFO("RefreshOrchestrator: stopped after {} cycles", m_cycles.load());
}

void RefreshOrchestrator::cancel_fetch_round()
{
    const std::lock_guard lock(m_round_mutex);
    if (const auto round = m_round.lock())
    {
        const std::lock_guard round_lock(round->mutex);
        round->cancelled = true;
        round->done_cv.notify_all();
    }
}

void RefreshOrchestrator::loop(std::stop_token stop_token)
{
    while (!stop_token.stop_requested())
    {
        static_cast<void>(run_cycle());

        std::unique_lock lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, stop_token, m_config.refresh.interval, [] { return false; });
    }
}

std::optional<CycleReport> RefreshOrchestrator::last_report() const
{
    const std::lock_guard lock(m_report_mutex);
    return m_last_report;
}

// -----------------------------------------------------------------
// fetch_all
//
// Each adapter runs on a detached thread holding the shared FetchRound.
// The cycle sleeps on the round's condition until every slot is filled,
// the common deadline passes, or stop() cancels the round. Slots still
// empty at that point are Timeouts and are never read again.
// -----------------------------------------------------------------

std::vector<FetchResult> RefreshOrchestrator::fetch_all()
{
    const auto timeout = m_config.refresh.fetch_timeout;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto& adapters = m_registry.providers();

    auto round = std::make_shared<FetchRound>();
    round->slots.resize(adapters.size());
    round->pending = adapters.size();
    {
        const std::lock_guard lock(m_round_mutex);
        m_round = round;
    }

    for (std::size_t i = 0; i < adapters.size(); ++i)
    {
        std::thread([provider = adapters[i], round, i, timeout] {
            FetchResult result;
            try
            {
                result = provider->fetch(timeout);
            }
            catch (const std::exception& e)
            {
                result = FetchResult::failure(core::ProviderErrorKind::Transport,
                                              std::string("adapter threw: ") + e.what());
            }
            catch (...)
            {
                result = FetchResult::failure(core::ProviderErrorKind::Transport,
                                              "adapter threw a non-standard exception");
            }

            const std::lock_guard lock(round->mutex);
            round->slots[i] = std::move(result);
            --round->pending;
            round->done_cv.notify_all();
        }).detach();
    }

    bool cancelled = false;
    std::vector<std::optional<FetchResult>> slots;
    {
        std::unique_lock lock(round->mutex);
        round->done_cv.wait_until(lock, deadline, [&] {
            return round->pending == 0 || round->cancelled || m_stop_requested.load();
        });
        cancelled = round->cancelled || m_stop_requested.load();
        slots = std::move(round->slots);
        // Late workers write into a fresh vector nobody reads
        round->slots.assign(slots.size(), std::nullopt);
    }
    {
        const std::lock_guard lock(m_round_mutex);
        m_round.reset();
    }

    std::vector<FetchResult> results;
    results.reserve(slots.size());

    for (std::size_t i = 0; i < slots.size(); ++i)
    {
        if (slots[i])
        {
            results.push_back(std::move(*slots[i]));
            continue;
        }

        if (cancelled)
        {
            NPL_CORE_WARN("RefreshOrchestrator: abandoning '{}' at shutdown", adapters[i]->name());
            results.push_back(FetchResult::failure(core::ProviderErrorKind::Timeout, "abandoned at shutdown"));
            continue;
        }

        NPL_CORE_WARN("RefreshOrchestrator: '{}' timed out after {} ms", adapters[i]->name(), timeout.count());
        results.push_back(FetchResult::failure(
            core::ProviderErrorKind::Timeout,
            "no answer within " + std::to_string(timeout.count()) + " ms"));
    }

    return results;
}

// -----------------------------------------------------------------
// run_cycle: Fetching → Merging → Publishing
// -----------------------------------------------------------------

CycleReport RefreshOrchestrator::run_cycle()
{
    CycleReport report;

    bool expected = false;
    if (!m_in_flight.compare_exchange_strong(expected, true))
    {
        NPL_CORE_WARN("RefreshOrchestrator: cycle already in flight, skipping");
        report.outcome = CycleOutcome::Skipped;
        return report;
    }
    const CycleGuard guard(m_in_flight, m_state);
    const auto started = std::chrono::steady_clock::now();

    // ---- Fetching ----
    m_state.store(CycleState::Fetching);
    const Instant attempted_at = m_now();
    std::vector<FetchResult> results = fetch_all();

    const SnapshotPtr previous = m_store.current();
    std::map<target::ProviderId, SourceStatus> sources;
    if (previous)
    {
        sources = previous->sources;
    }

    std::vector<target::Target> fresh;
    std::set<target::ProviderId> failed;

    for (std::size_t i = 0; i < results.size(); ++i)
    {
        const target::ProviderId id = m_registry.providers()[i]->id();
        FetchResult& result = results[i];

        if (result.ok())
        {
            admit_records(*m_registry.providers()[i], result);
        }
        update_status(sources[id], result, attempted_at);

        ProviderReport provider_report{
            .id      = id,
            .records = static_cast<u32>(result.records.size()),
            .skipped = static_cast<u32>(result.skipped.size()),
            .error   = result.error,
        };

        if (result.ok())
        {
            fresh.insert(fresh.end(), std::make_move_iterator(result.records.begin()),
                         std::make_move_iterator(result.records.end()));
        }
        else
        {
            NPL_CORE_ERROR("RefreshOrchestrator: '{}' failed: {}",
                           m_registry.providers()[i]->name(), result.error->describe());
            failed.insert(id);
        }

        report.providers.push_back(std::move(provider_report));
    }

    const auto finish = [&](CycleOutcome outcome) {
        report.outcome = outcome;
        report.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
        if (outcome != CycleOutcome::Cancelled)
        {
            ++m_cycles;
        }
        NPL_CORE_INFO("RefreshOrchestrator: cycle {} ({} fresh records, {} targets, {} failed providers)",
                      outcome_name(outcome), fresh.size(), report.merged_targets, failed.size());
        const std::lock_guard lock(m_report_mutex);
        m_last_report = report;
        return report;
    };

    if (m_stop_requested.load())
    {
        return finish(CycleOutcome::Cancelled);
    }

    // ---- All providers failed: keep the previous targets, mark stale ----
    if (failed.size() == results.size())
    {
        if (!previous)
        {
            NPL_CORE_ERROR("RefreshOrchestrator: every provider failed and no snapshot exists yet");
            return finish(CycleOutcome::NothingPublished);
        }

        m_state.store(CycleState::Publishing);
        auto stale = std::make_shared<Snapshot>(*previous);
        stale->stale = true;
        stale->sources = std::move(sources);
        report.merged_targets = static_cast<u32>(stale->size());
        report.published_version = stale->version;
        m_store.publish(std::move(stale));

        NPL_CORE_WARN("RefreshOrchestrator: every provider failed, keeping v{} as stale", previous->version);
        return finish(CycleOutcome::Stale);
    }

    // ---- Merging ----
    m_state.store(CycleState::Merging);
    const TargetList no_targets;
    DedupResult merged = m_deduplicator.deduplicate(fresh, previous ? *previous->targets : no_targets, failed);

    report.merged_targets = static_cast<u32>(merged.targets.size());
    report.ambiguities = merged.ambiguities;
    report.retained = merged.retained;
    report.dropped = merged.dropped;

    if (m_stop_requested.load())
    {
        return finish(CycleOutcome::Cancelled);
    }

    // ---- Publishing ----
    m_state.store(CycleState::Publishing);
    auto snapshot = std::make_shared<Snapshot>();
    snapshot->version = previous ? previous->version + 1 : 1;
    snapshot->published_at = m_now();
    snapshot->stale = false;
    snapshot->targets = std::make_shared<const TargetList>(std::move(merged.targets));
    snapshot->sources = std::move(sources);

    report.published_version = snapshot->version;
    NPL_CORE_DEBUG("RefreshOrchestrator: publishing v{} at {}",
                   snapshot->version, astro::TimeSystem::format_iso8601(snapshot->published_at));
    m_store.publish(std::move(snapshot));

    return finish(CycleOutcome::Published);
}

} // namespace neoplan::pipeline
