#pragma once

/// @file target.hpp
/// @brief Normalized NEO candidate record shared by providers, deduplication and ranking.

#include "core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace neoplan::target
{
    /// @brief Alert feeds known to the pipeline.
    ///
    /// Declaration order is the provider priority: earlier entries win ties
    /// when merging duplicate reports.
    enum class ProviderId : u8
    {
        Neocp,   ///< MPC NEO Confirmation Page
        Scout,   ///< JPL Scout hazard assessment
        Sentry,  ///< JPL Sentry impact monitoring
        Fink,    ///< Fink alert broker
        Manual,  ///< Operator-supplied records
    };

    inline const char* provider_name(ProviderId id)
    {
        switch (id)
        {
            case ProviderId::Neocp:  return "neocp";
            case ProviderId::Scout:  return "scout";
            case ProviderId::Sentry: return "sentry";
            case ProviderId::Fink:   return "fink";
            case ProviderId::Manual: return "manual";
            default:                 return "unknown";
        }
    }

    /// @brief Inverse of provider_name() (case-insensitive).
    [[nodiscard]] std::optional<ProviderId> provider_from_name(std::string_view name);

    /// @brief Opaque provider payload kept for traceability; never interpreted.
    struct RawPayload
    {
        ProviderId  provider;
        std::string payload;

        bool operator==(const RawPayload&) const = default;
    };

    /// @brief One candidate object as known to the system.
    ///
    /// Every optional field is either a value inside its domain or absent;
    /// absent never means zero.
    struct Target
    {
        // ---- Identity ----
        std::string              designation;   ///< Provider-assigned, not unique across providers
        ProviderId               source{ProviderId::Manual};
        std::string              source_url;
        std::vector<std::string> aliases;       ///< Cross-identifications declared by providers

        // ---- Position (J2000) ----
        f64     ra_deg{0.0};    ///< Right ascension [0, 360)
        f64     dec_deg{0.0};   ///< Declination [-90, 90]
        Instant epoch{};        ///< Instant the position is valid for

        // ---- Brightness ----
        std::optional<f64> mag_v;   ///< Apparent V magnitude (lower = brighter)
        std::optional<f64> mag_h;   ///< Absolute magnitude

        // ---- Orbit quality ----
        std::optional<i32> n_obs;
        std::optional<f64> arc_days;
        std::optional<f64> not_seen_days;

        // ---- Risk scores ----
        std::optional<f64> neo_score;    ///< 0–100
        std::optional<f64> pha_score;    ///< >= 0
        std::optional<f64> impact_prob;  ///< [0, 1]

        // ---- Bookkeeping ----
        Instant                 updated_at{};
        std::set<ProviderId>    contributing_sources;
        std::vector<RawPayload> raw;

        bool operator==(const Target&) const = default;
    };

    /// @brief Check every domain constraint of a Target.
    /// @return A description of the first violated constraint, or std::nullopt if valid.
    [[nodiscard]] std::optional<std::string> validate_target(const Target& target);

    /// @brief True if `name` equals the designation or one of the aliases (case-insensitive).
    [[nodiscard]] bool answers_to(const Target& target, std::string_view name);

    /// @brief Case-insensitive ASCII string comparison.
    [[nodiscard]] bool iequals(std::string_view a, std::string_view b);

} // namespace neoplan::target
