#pragma once

/// @file config.hpp
/// @brief Pipeline configuration structs and environment overrides.

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace neoplan::core
{
    /// @brief Refresh loop timing.
    /// Use designated initializers: RefreshConfig{.interval = std::chrono::seconds(60)}.
    struct RefreshConfig
    {
        std::chrono::milliseconds interval      = std::chrono::minutes(5);
        std::chrono::milliseconds fetch_timeout = std::chrono::seconds(10);
    };

    /// @brief Cross-source matching thresholds.
    struct DedupConfig
    {
        f64                  match_radius_arcsec = 2.0;
        std::chrono::seconds epoch_window        = std::chrono::hours(1);
    };

    /// @brief Sampling grid of the observability computation.
    struct ObservabilityConfig
    {
        std::chrono::minutes sun_step    = std::chrono::minutes(15);
        std::chrono::hours   horizon     = std::chrono::hours(24);
        std::chrono::minutes target_step = std::chrono::minutes(10);
    };

    /// @brief Relative weights of the priority terms. Zero disables a term.
    struct ScoringWeights
    {
        f64 urgency       = 1.0;
        f64 orbit         = 1.0;
        f64 neo           = 1.0;
        f64 pha           = 1.5;
        f64 impact        = 3.0;
        f64 observability = 0.5;
        f64 brightness    = 0.3;

        f64 arc_floor_days = 0.1;   ///< Floor of the orbit-uncertainty term
    };

    /// @brief Everything the pipeline needs, with defaults.
    struct PipelineConfig
    {
        RefreshConfig       refresh;
        DedupConfig         dedup;
        ObservabilityConfig observability;
        ScoringWeights      weights;
        std::string         feed_dir = "data/feeds";
    };

    /// @brief Defaults overridden by NEOPLAN_* environment variables.
    ///
    /// Recognised: NEOPLAN_REFRESH_SECONDS, NEOPLAN_FETCH_TIMEOUT_SECONDS,
    /// NEOPLAN_MATCH_RADIUS_ARCSEC, NEOPLAN_EPOCH_WINDOW_MINUTES, NEOPLAN_FEED_DIR.
    /// Unparsable or non-positive values are logged and ignored.
    [[nodiscard]] PipelineConfig load_config_from_environment();

    /// @brief Check a configuration for non-positive steps, intervals and thresholds.
    /// @return A description of the first problem, or std::nullopt if valid.
    [[nodiscard]] std::optional<std::string> validate_config(const PipelineConfig& config);

} // namespace neoplan::core
