#pragma once

/// @file static_provider.hpp
/// @brief In-memory adapter with scriptable records, failures, latency and exceptions.

#include "providers/provider.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace neoplan::providers
{
    /// @brief Adapter serving records held in memory.
    ///
    /// Used for embedding the pipeline with pre-decoded data and for exercising
    /// the orchestrator's failure isolation. All setters are thread-safe and
    /// affect the next fetch().
    class StaticProvider : public TargetProvider
    {
    public:
        explicit StaticProvider(target::ProviderId id, std::vector<target::Target> records = {});

        [[nodiscard]] target::ProviderId id() const override { return m_id; }
        [[nodiscard]] FetchResult fetch(std::chrono::milliseconds timeout) override;

        /// @brief Replace the served records and clear any scripted failure.
        void set_records(std::vector<target::Target> records);

        /// @brief Make every following fetch fail with this error.
        void set_failure(core::ProviderErrorKind kind, std::string message);

        /// @brief Make every following fetch throw std::runtime_error.
        void set_throw(std::string message);

        /// @brief Sleep this long inside fetch() before answering.
        void set_latency(std::chrono::milliseconds latency);

        /// @brief Number of fetch() calls so far.
        [[nodiscard]] u32 fetch_count() const { return m_fetch_count.load(); }

    private:
        target::ProviderId m_id;

        mutable std::mutex                 m_mutex;
        std::vector<target::Target>        m_records;
        std::optional<core::ProviderError> m_failure;
        std::optional<std::string>         m_throw_message;
        std::chrono::milliseconds          m_latency{0};

        std::atomic<u32> m_fetch_count{0};
    };

} // namespace neoplan::providers
