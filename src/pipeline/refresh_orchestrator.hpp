#pragma once

/// @file refresh_orchestrator.hpp
/// @brief Periodic fetch → deduplicate → publish loop, the only Snapshot writer.

#include "core/config.hpp"
#include "core/types.hpp"
#include "pipeline/deduplicator.hpp"
#include "pipeline/snapshot_store.hpp"
#include "providers/provider_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace neoplan::pipeline
{
    /// @brief Phase of the refresh cycle currently running.
    enum class CycleState
    {
        Idle,
        Fetching,
        Merging,
        Publishing,
    };

    /// @brief How a cycle ended.
    enum class CycleOutcome
    {
        Published,          ///< At least one provider answered; a new Snapshot is current
        Stale,              ///< Every provider failed; the previous Snapshot was re-published as stale
        NothingPublished,   ///< Every provider failed and nothing had been published yet
        Skipped,            ///< Another cycle was in flight
        Cancelled,          ///< stop() was requested before publication
    };

    inline const char* state_name(CycleState state)
    {
        switch (state)
        {
            case CycleState::Idle:       return "idle";
            case CycleState::Fetching:   return "fetching";
            case CycleState::Merging:    return "merging";
            case CycleState::Publishing: return "publishing";
            default:                     return "unknown";
        }
    }

    inline const char* outcome_name(CycleOutcome outcome)
    {
        switch (outcome)
        {
            case CycleOutcome::Published:        return "published";
            case CycleOutcome::Stale:            return "stale";
            case CycleOutcome::NothingPublished: return "nothing published";
            case CycleOutcome::Skipped:          return "skipped";
            case CycleOutcome::Cancelled:        return "cancelled";
            default:                             return "unknown";
        }
    }

    /// @brief Result of one provider within a cycle.
    struct ProviderReport
    {
        target::ProviderId                 id;
        u32                                records = 0;
        u32                                skipped = 0;     ///< Records dropped as unparsable
        std::optional<core::ProviderError> error;
    };

    /// @brief Summary of one cycle.
    struct CycleReport
    {
        CycleOutcome                outcome = CycleOutcome::Skipped;
        std::vector<ProviderReport> providers;
        u32                         merged_targets = 0;
        u32                         ambiguities    = 0;
        u32                         retained       = 0;
        u32                         dropped        = 0;
        std::optional<u64>          published_version;
        Duration                    elapsed{};
    };

    /// @brief Completion state shared by one cycle and its detached fetch workers.
    struct FetchRound
    {
        std::mutex                                         mutex;
        std::condition_variable                            done_cv;
        std::vector<std::optional<providers::FetchResult>> slots;
        std::size_t                                        pending   = 0;
        bool                                               cancelled = false;
    };

    /// @brief Drives refresh cycles against a SnapshotStore.
    ///
    /// Every cycle fetches all registered providers concurrently, each on its
    /// own thread with its own deadline. A provider that times out, fails or
    /// throws contributes nothing; the others proceed. A timed-out fetch
    /// thread is abandoned and keeps its adapter alive until it returns.
    ///
    /// Cycles never overlap: a cycle requested while one is running returns
    /// CycleOutcome::Skipped immediately.
    class RefreshOrchestrator
    {
    public:
        using TimeSource = std::function<Instant()>;

        RefreshOrchestrator(providers::ProviderRegistry registry,
                            SnapshotStore& store,
                            core::PipelineConfig config = {},
                            TimeSource now = &Clock::now);

        /// @brief Stops the background loop if running.
        ~RefreshOrchestrator();

        RefreshOrchestrator(const RefreshOrchestrator&) = delete;
        RefreshOrchestrator& operator=(const RefreshOrchestrator&) = delete;

        /// @brief Launch the background loop: one cycle now, then one per interval.
        void start();

        /// @brief Request cancellation and join the loop. Safe to call repeatedly.
        ///
        /// Fetches still running are abandoned; the cycle in flight ends Cancelled
        /// without waiting for them.
        void stop();

        /// @brief Run one cycle on the calling thread.
        CycleReport run_cycle();

        [[nodiscard]] bool running() const { return m_thread.joinable(); }
        [[nodiscard]] CycleState state() const { return m_state.load(); }
        [[nodiscard]] u64 cycles_completed() const { return m_cycles.load(); }

        /// @brief Report of the most recent cycle that was not skipped.
        [[nodiscard]] std::optional<CycleReport> last_report() const;

        [[nodiscard]] const providers::ProviderRegistry& registry() const { return m_registry; }

    private:
        /// @brief Fetch every provider concurrently, honouring the per-provider deadline.
        [[nodiscard]] std::vector<providers::FetchResult> fetch_all();

        /// @brief Wake the cycle waiting on the current fetch round, if any.
        void cancel_fetch_round();

        void loop(std::stop_token stop_token);

        providers::ProviderRegistry m_registry;
        SnapshotStore&              m_store;
        core::PipelineConfig        m_config;
        TimeSource                  m_now;
        Deduplicator                m_deduplicator;

        std::atomic<CycleState> m_state{CycleState::Idle};
        std::atomic<bool>       m_in_flight{false};
        std::atomic<bool>       m_stop_requested{false};
        std::atomic<u64>        m_cycles{0};

        mutable std::mutex         m_report_mutex;
        std::optional<CycleReport> m_last_report;

        std::mutex                  m_round_mutex;
        std::weak_ptr<FetchRound>   m_round;

        std::mutex                  m_wait_mutex;
        std::condition_variable_any m_wait_cv;
        std::jthread                m_thread;
    };

} // namespace neoplan::pipeline
