#pragma once

/// @file provider.hpp
/// @brief Adapter contract implemented by every alert-feed provider.

#include "core/errors.hpp"
#include "target/target.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace neoplan::providers
{
    /// @brief Outcome of one fetch.
    ///
    /// Either `error` is set and `records` is empty (the whole fetch failed),
    /// or `error` is empty and `records` holds every record that decoded.
    /// `skipped` lists the Parse errors of records dropped along the way.
    struct FetchResult
    {
        std::vector<target::Target>        records;
        std::optional<core::ProviderError> error;
        std::vector<core::ProviderError>   skipped;

        [[nodiscard]] bool ok() const { return !error.has_value(); }

        [[nodiscard]] static FetchResult success(std::vector<target::Target> records,
                                                 std::vector<core::ProviderError> skipped = {})
        {
            FetchResult result;
            result.records = std::move(records);
            result.skipped = std::move(skipped);
            return result;
        }

        [[nodiscard]] static FetchResult failure(core::ProviderErrorKind kind, std::string message)
        {
            FetchResult result;
            result.error = core::ProviderError{.kind = kind, .message = std::move(message)};
            return result;
        }
    };

    /// @brief Abstract alert-feed adapter.
    ///
    /// Implementations own their transport and payload decoding; the pipeline
    /// only sees normalized Targets. fetch() is called from a worker thread and
    /// may outlive the cycle that started it if it exceeds its deadline.
    class TargetProvider
    {
    public:
        virtual ~TargetProvider() = default;

        /// @brief Feed this adapter reports for.
        [[nodiscard]] virtual target::ProviderId id() const = 0;

        /// @brief Human-readable name used in logs and status output.
        [[nodiscard]] virtual std::string name() const { return target::provider_name(id()); }

        /// @brief Retrieve the feed's current records.
        /// @param timeout Deadline hint; the orchestrator enforces it regardless.
        [[nodiscard]] virtual FetchResult fetch(std::chrono::milliseconds timeout) = 0;
    };

} // namespace neoplan::providers
