/// @file config.cpp
/// @brief Environment overrides and validation for PipelineConfig.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace neoplan::core
{

namespace
{

/// Positive finite number from an environment variable, std::nullopt if unset or invalid.
std::optional<f64> read_positive(const char* name)
{
    const char* raw = std::getenv(name);
    if (raw == nullptr)
    {
        return std::nullopt;
    }

    const std::string_view sv(raw);
    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value) || value <= 0.0)
    {
        NPL_CORE_WARN("Config: ignoring {}='{}' (expected a positive number)", name, sv);
        return std::nullopt;
    }

    return value;
}

template <typename Rep, typename Period>
bool positive(std::chrono::duration<Rep, Period> d)
{
    return d.count() > 0;
}

} // anonymous namespace

PipelineConfig load_config_from_environment()
{
    PipelineConfig config;

    if (const auto seconds = read_positive("NEOPLAN_REFRESH_SECONDS"))
    {
        config.refresh.interval = std::chrono::milliseconds(
            static_cast<i64>(std::llround(*seconds * 1000.0)));
    }
    if (const auto seconds = read_positive("NEOPLAN_FETCH_TIMEOUT_SECONDS"))
    {
        config.refresh.fetch_timeout = std::chrono::milliseconds(
            static_cast<i64>(std::llround(*seconds * 1000.0)));
    }
    if (const auto arcsec = read_positive("NEOPLAN_MATCH_RADIUS_ARCSEC"))
    {
        config.dedup.match_radius_arcsec = *arcsec;
    }
    if (const auto minutes = read_positive("NEOPLAN_EPOCH_WINDOW_MINUTES"))
    {
        config.dedup.epoch_window = std::chrono::seconds(
            static_cast<i64>(std::llround(*minutes * 60.0)));
    }
    if (const char* dir = std::getenv("NEOPLAN_FEED_DIR"); dir != nullptr && *dir != '\0')
    {
        config.feed_dir = dir;
    }

    NPL_CORE_DEBUG("Config: refresh {} ms, fetch timeout {} ms, match {}\", epoch window {} s",
                   config.refresh.interval.count(), config.refresh.fetch_timeout.count(),
                   config.dedup.match_radius_arcsec, config.dedup.epoch_window.count());

    return config;
}

std::optional<std::string> validate_config(const PipelineConfig& config)
{
    if (!positive(config.refresh.interval))
    {
        return "refresh interval must be positive";
    }
    if (!positive(config.refresh.fetch_timeout))
    {
        return "fetch timeout must be positive";
    }
    if (!std::isfinite(config.dedup.match_radius_arcsec) || config.dedup.match_radius_arcsec <= 0.0)
    {
        return "match radius must be positive";
    }
    if (config.dedup.epoch_window.count() < 0)
    {
        return "epoch window must not be negative";
    }
    if (!positive(config.observability.sun_step) || !positive(config.observability.target_step))
    {
        return "observability sampling steps must be positive";
    }
    if (!positive(config.observability.horizon))
    {
        return "observability horizon must be positive";
    }
    if (!std::isfinite(config.weights.arc_floor_days) || config.weights.arc_floor_days <= 0.0)
    {
        return "arc floor must be positive";
    }
    return std::nullopt;
}

} // namespace neoplan::core
