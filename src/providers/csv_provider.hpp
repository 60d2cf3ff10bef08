#pragma once

/// @file csv_provider.hpp
/// @brief Adapter reading a local CSV feed file, one candidate per line.

#include "core/types.hpp"
#include "providers/provider.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace neoplan::providers
{
    /// @brief Reads a feed exported to CSV.
    ///
    /// Expected columns (header row required, skipped):
    ///   designation, ra_deg, dec_deg, epoch, updated_at, mag_v, mag_h, n_obs,
    ///   arc_days, not_seen_days, neo_score, pha_score, impact_prob, aliases
    ///
    /// designation, ra_deg, dec_deg and epoch are mandatory. Every other field
    /// may be left empty to mean "absent". Timestamps are ISO-8601 UTC;
    /// updated_at defaults to epoch. aliases are separated by ';'.
    /// Malformed lines are skipped and reported as Parse errors; an unreadable
    /// file fails the whole fetch with a Transport error.
    class CsvProvider : public TargetProvider
    {
    public:
        CsvProvider(target::ProviderId id, std::filesystem::path path, std::string source_url = {});

        [[nodiscard]] target::ProviderId id() const override { return m_id; }
        [[nodiscard]] std::string name() const override;
        [[nodiscard]] FetchResult fetch(std::chrono::milliseconds timeout) override;

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        /// @brief Decode a single data line.
        /// @return The record, or a description of why the line was rejected.
        [[nodiscard]] static std::optional<target::Target> parse_line(
            std::string_view line,
            target::ProviderId id,
            std::string* error = nullptr
        );

        static constexpr std::size_t kColumnCount = 14;

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single i32 value from a trimmed string_view.
        [[nodiscard]] static std::optional<i32> parse_i32(std::string_view sv);

        target::ProviderId    m_id;
        std::filesystem::path m_path;
        std::string           m_source_url;
    };

} // namespace neoplan::providers
