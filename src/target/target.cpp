/// @file target.cpp
/// @brief Target validation and name matching.

#include "target/target.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace neoplan::target
{

std::optional<ProviderId> provider_from_name(std::string_view name)
{
    for (const ProviderId id : {ProviderId::Neocp, ProviderId::Scout, ProviderId::Sentry,
                                ProviderId::Fink, ProviderId::Manual})
    {
        if (iequals(name, provider_name(id)))
        {
            return id;
        }
    }
    return std::nullopt;
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

bool answers_to(const Target& target, std::string_view name)
{
    if (iequals(target.designation, name))
    {
        return true;
    }
    return std::any_of(target.aliases.begin(), target.aliases.end(),
                       [name](const std::string& alias) { return iequals(alias, name); });
}

// -----------------------------------------------------------------
// validate_target: domain checks, first failure wins
// -----------------------------------------------------------------

std::optional<std::string> validate_target(const Target& target)
{
    if (target.designation.empty())
    {
        return "empty designation";
    }
    if (target.contributing_sources.empty())
    {
        return "no contributing sources";
    }
    if (!std::isfinite(target.ra_deg) || target.ra_deg < 0.0 || target.ra_deg >= 360.0)
    {
        return fmt::format("ra_deg {} outside [0, 360)", target.ra_deg);
    }
    if (!std::isfinite(target.dec_deg) || target.dec_deg < -90.0 || target.dec_deg > 90.0)
    {
        return fmt::format("dec_deg {} outside [-90, 90]", target.dec_deg);
    }

    const auto finite_if_present = [](const std::optional<f64>& v) {
        return !v || std::isfinite(*v);
    };
    if (!finite_if_present(target.mag_v) || !finite_if_present(target.mag_h))
    {
        return "non-finite magnitude";
    }
    if (target.n_obs && *target.n_obs < 0)
    {
        return fmt::format("n_obs {} is negative", *target.n_obs);
    }
    if (target.arc_days && (!std::isfinite(*target.arc_days) || *target.arc_days < 0.0))
    {
        return "arc_days must be >= 0";
    }
    if (target.not_seen_days && (!std::isfinite(*target.not_seen_days) || *target.not_seen_days < 0.0))
    {
        return "not_seen_days must be >= 0";
    }
    if (target.neo_score && (!std::isfinite(*target.neo_score)
                             || *target.neo_score < 0.0 || *target.neo_score > 100.0))
    {
        return "neo_score outside [0, 100]";
    }
    if (target.pha_score && (!std::isfinite(*target.pha_score) || *target.pha_score < 0.0))
    {
        return "pha_score must be >= 0";
    }
    if (target.impact_prob && (!std::isfinite(*target.impact_prob)
                               || *target.impact_prob < 0.0 || *target.impact_prob > 1.0))
    {
        return "impact_prob outside [0, 1]";
    }

    return std::nullopt;
}

} // namespace neoplan::target
