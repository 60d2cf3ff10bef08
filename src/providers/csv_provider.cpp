/// @file csv_provider.cpp
/// @brief CSV feed adapter.

#include "providers/csv_provider.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <vector>

namespace neoplan::providers
{

namespace
{

/// Split on ',' without merging empty fields.
std::vector<std::string_view> split(std::string_view line, char delimiter)
{
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true)
    {
        const std::size_t pos = line.find(delimiter, begin);
        if (pos == std::string_view::npos)
        {
            fields.push_back(line.substr(begin));
            return fields;
        }
        fields.push_back(line.substr(begin, pos - begin));
        begin = pos + 1;
    }
}

enum Column : std::size_t
{
    kDesignation,
    kRa,
    kDec,
    kEpoch,
    kUpdatedAt,
    kMagV,
    kMagH,
    kNObs,
    kArcDays,
    kNotSeenDays,
    kNeoScore,
    kPhaScore,
    kImpactProb,
    kAliases,
};

} // anonymous namespace

CsvProvider::CsvProvider(target::ProviderId id, std::filesystem::path path, std::string source_url)
    : m_id(id)
    , m_path(std::move(path))
    , m_source_url(std::move(source_url))
{
}

std::string CsvProvider::name() const
{
    return std::string(target::provider_name(m_id)) + " (" + m_path.filename().string() + ")";
}

// -----------------------------------------------------------------
// fetch: whole-file read, per-line decode
// -----------------------------------------------------------------

FetchResult CsvProvider::fetch(std::chrono::milliseconds /*timeout*/)
{
    std::ifstream file(m_path);
    if (!file.is_open())
    {
        NPL_CORE_ERROR("CsvProvider: Failed to open file: {}", m_path.string());
        return FetchResult::failure(core::ProviderErrorKind::Transport,
                                    "cannot open " + m_path.string());
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        NPL_CORE_ERROR("CsvProvider: File is empty: {}", m_path.string());
        return FetchResult::failure(core::ProviderErrorKind::Parse,
                                    "empty feed " + m_path.string());
    }

    std::vector<target::Target> records;
    std::vector<core::ProviderError> skipped;
    u32 line_number = 1;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        std::string error;
        auto record = parse_line(line, m_id, &error);
        if (!record)
        {
            NPL_CORE_WARN("CsvProvider: Malformed line {} in {}: {}",
                          line_number, m_path.filename().string(), error);
            skipped.push_back(core::ProviderError{
                .kind    = core::ProviderErrorKind::Parse,
                .message = "line " + std::to_string(line_number) + ": " + error,
            });
            continue;
        }

        record->source_url = m_source_url;
        records.push_back(std::move(*record));
    }

    if (!skipped.empty())
    {
        NPL_CORE_WARN("CsvProvider: Skipped {} malformed lines", skipped.size());
    }

    NPL_CORE_INFO("CsvProvider: Loaded {} records from {}", records.size(), m_path.string());

    return FetchResult::success(std::move(records), std::move(skipped));
}

// -----------------------------------------------------------------
// parse_line
// -----------------------------------------------------------------

std::optional<target::Target> CsvProvider::parse_line(std::string_view line,
                                                      target::ProviderId id,
                                                      std::string* error)
{
    const auto fail = [error](std::string message) -> std::optional<target::Target> {
        if (error != nullptr)
        {
            *error = std::move(message);
        }
        return std::nullopt;
    };

    const std::vector<std::string_view> fields = split(trim(line), ',');
    if (fields.size() != kColumnCount)
    {
        return fail("expected " + std::to_string(kColumnCount) + " columns, got "
                    + std::to_string(fields.size()));
    }

    target::Target record;
    record.designation = std::string(trim(fields[kDesignation]));
    record.source = id;
    record.contributing_sources = {id};

    const auto ra  = parse_f64(trim(fields[kRa]));
    const auto dec = parse_f64(trim(fields[kDec]));
    if (!ra || !dec)
    {
        return fail("unparsable position");
    }
    record.ra_deg = *ra;
    record.dec_deg = *dec;

    const auto epoch = astro::TimeSystem::parse_iso8601(trim(fields[kEpoch]));
    if (!epoch)
    {
        return fail("unparsable epoch");
    }
    record.epoch = *epoch;

    const std::string_view updated = trim(fields[kUpdatedAt]);
    if (updated.empty())
    {
        record.updated_at = record.epoch;
    }
    else if (const auto ts = astro::TimeSystem::parse_iso8601(updated))
    {
        record.updated_at = *ts;
    }
    else
    {
        return fail("unparsable updated_at");
    }

    // Optional numeric columns: empty means absent, garbage rejects the line.
    bool numeric_ok = true;
    const auto optional_f64 = [&numeric_ok](std::string_view field) -> std::optional<f64> {
        const std::string_view sv = trim(field);
        if (sv.empty())
        {
            return std::nullopt;
        }
        const auto value = parse_f64(sv);
        numeric_ok = numeric_ok && value.has_value();
        return value;
    };

    record.mag_v         = optional_f64(fields[kMagV]);
    record.mag_h         = optional_f64(fields[kMagH]);
    record.arc_days      = optional_f64(fields[kArcDays]);
    record.not_seen_days = optional_f64(fields[kNotSeenDays]);
    record.neo_score     = optional_f64(fields[kNeoScore]);
    record.pha_score     = optional_f64(fields[kPhaScore]);
    record.impact_prob   = optional_f64(fields[kImpactProb]);

    if (const std::string_view n_obs = trim(fields[kNObs]); !n_obs.empty())
    {
        record.n_obs = parse_i32(n_obs);
        numeric_ok = numeric_ok && record.n_obs.has_value();
    }

    if (!numeric_ok)
    {
        return fail("unparsable numeric field");
    }

    for (const std::string_view alias : split(trim(fields[kAliases]), ';'))
    {
        if (const std::string_view a = trim(alias); !a.empty())
        {
            record.aliases.emplace_back(a);
        }
    }

    if (const auto problem = target::validate_target(record))
    {
        return fail(*problem);
    }

    record.raw.push_back(target::RawPayload{.provider = id, .payload = std::string(trim(line))});
    return record;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CsvProvider::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse numbers from string_view
// -----------------------------------------------------------------

std::optional<f64> CsvProvider::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<i32> CsvProvider::parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace neoplan::providers
