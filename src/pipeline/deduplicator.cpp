/// @file deduplicator.cpp
/// @brief Candidate matching, union-find clustering and field-wise merge.

#include "pipeline/deduplicator.hpp"

#include "astro/coordinates.hpp"
#include "core/logger.hpp"
#include "pipeline/sky_index.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <numeric>
#include <string>
#include <tuple>
#include <unordered_map>

namespace neoplan::pipeline
{

namespace
{

using target::ProviderId;
using target::Target;

/// A record taking part in one pass, tagged with where it came from.
struct Entry
{
    const Target* record = nullptr;
    bool          fresh  = true;
};

std::string lowercase(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool raw_less(const target::RawPayload& a, const target::RawPayload& b)
{
    return std::tie(a.provider, a.payload) < std::tie(b.provider, b.payload);
}

/// Total order over records, so equal inputs always land in the same slots.
bool canonical_less(const Entry& a, const Entry& b)
{
    const Target& x = *a.record;
    const Target& y = *b.record;

    const auto key = [](const Entry& e) {
        const Target& t = *e.record;
        return std::tie(t.designation, t.source, t.epoch, t.updated_at, t.ra_deg, t.dec_deg);
    };
    if (key(a) != key(b))
    {
        return key(a) < key(b);
    }
    if (a.fresh != b.fresh)
    {
        return a.fresh;
    }

    const auto values = [](const Target& t) {
        return std::tie(t.mag_v, t.mag_h, t.n_obs, t.arc_days, t.not_seen_days,
                        t.neo_score, t.pha_score, t.impact_prob, t.source_url, t.aliases);
    };
    if (values(x) != values(y))
    {
        return values(x) < values(y);
    }
    return std::lexicographical_compare(x.raw.begin(), x.raw.end(), y.raw.begin(), y.raw.end(), raw_less);
}

/// Merge priority: provider order, then designation.
bool higher_priority(const Target& a, const Target& b)
{
    return std::tie(a.source, a.designation) < std::tie(b.source, b.designation);
}

/// Pick the most recently updated present value of one optional field.
template <typename T>
std::optional<T> latest_value(const std::vector<Entry>& members, std::optional<T> Target::*field)
{
    const Target* best = nullptr;
    for (const Entry& e : members)
    {
        const Target& t = *e.record;
        if (!(t.*field))
        {
            continue;
        }
        if (best == nullptr)
        {
            best = &t;
            continue;
        }

        if (t.updated_at != best->updated_at)
        {
            if (t.updated_at > best->updated_at)
            {
                best = &t;
            }
        }
        else if (t.source != best->source || t.designation != best->designation)
        {
            if (higher_priority(t, *best))
            {
                best = &t;
            }
        }
        else if (*(t.*field) < *(best->*field))
        {
            best = &t;
        }
    }
    if (best == nullptr)
    {
        return std::nullopt;
    }
    return best->*field;
}

/// Field-wise merge of one cluster. Members arrive in canonical order.
Target merge_members(const std::vector<Entry>& members)
{
    const Target* primary = members.front().record;
    const Target* positional = members.front().record;
    for (const Entry& e : members)
    {
        if (higher_priority(*e.record, *primary))
        {
            primary = e.record;
        }
        if (e.record->epoch > positional->epoch
            || (e.record->epoch == positional->epoch && higher_priority(*e.record, *positional)))
        {
            positional = e.record;
        }
    }

    Target merged;

    // ---- Identity ----
    merged.designation = primary->designation;
    merged.source      = primary->source;
    merged.source_url  = primary->source_url;

    // ---- Position, taken as a unit ----
    merged.ra_deg  = positional->ra_deg;
    merged.dec_deg = positional->dec_deg;
    merged.epoch   = positional->epoch;

    // ---- Scalars ----
    merged.mag_v         = latest_value(members, &Target::mag_v);
    merged.mag_h         = latest_value(members, &Target::mag_h);
    merged.n_obs         = latest_value(members, &Target::n_obs);
    merged.arc_days      = latest_value(members, &Target::arc_days);
    merged.not_seen_days = latest_value(members, &Target::not_seen_days);
    merged.neo_score     = latest_value(members, &Target::neo_score);
    merged.pha_score     = latest_value(members, &Target::pha_score);
    merged.impact_prob   = latest_value(members, &Target::impact_prob);

    // ---- Bookkeeping ----
    std::set<ProviderId> fresh_providers;
    for (const Entry& e : members)
    {
        merged.updated_at = std::max(merged.updated_at, e.record->updated_at);
        merged.contributing_sources.insert(e.record->contributing_sources.begin(),
                                           e.record->contributing_sources.end());
        if (e.fresh)
        {
            fresh_providers.insert(e.record->contributing_sources.begin(),
                                   e.record->contributing_sources.end());
        }
    }

    // Fresh payloads replace older payloads of the same provider.
    for (const Entry& e : members)
    {
        for (const auto& payload : e.record->raw)
        {
            if (e.fresh || !fresh_providers.contains(payload.provider))
            {
                merged.raw.push_back(payload);
            }
        }
    }
    std::sort(merged.raw.begin(), merged.raw.end(), raw_less);
    merged.raw.erase(std::unique(merged.raw.begin(), merged.raw.end()), merged.raw.end());

    // ---- Aliases: every other name the object was reported under ----
    std::map<std::string, std::string> names;   // lowercase -> first spelling in sorted order
    const std::string own = lowercase(merged.designation);
    const auto add_name = [&names, &own](const std::string& name) {
        if (name.empty())
        {
            return;
        }
        const std::string key = lowercase(name);
        if (key == own)
        {
            return;
        }
        const auto it = names.find(key);
        if (it == names.end() || name < it->second)
        {
            names[key] = name;
        }
    };
    for (const Entry& e : members)
    {
        add_name(e.record->designation);
        for (const auto& alias : e.record->aliases)
        {
            add_name(alias);
        }
    }
    for (const auto& [key, name] : names)
    {
        merged.aliases.push_back(name);
    }

    return merged;
}

// -----------------------------------------------------------------
// Union-find with per-cluster provider claims
// -----------------------------------------------------------------

class Clusters
{
public:
    explicit Clusters(const std::vector<Entry>& entries)
        : m_parent(entries.size())
        , m_size(entries.size(), 1)
        , m_claims(entries.size())
    {
        std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            if (!entries[i].fresh)
            {
                continue;
            }
            const std::string name = lowercase(entries[i].record->designation);
            for (const ProviderId p : entries[i].record->contributing_sources)
            {
                m_claims[i].emplace(p, name);
            }
        }
    }

    std::size_t find(std::size_t i)
    {
        while (m_parent[i] != i)
        {
            m_parent[i] = m_parent[m_parent[i]];
            i = m_parent[i];
        }
        return i;
    }

    /// Two clusters conflict if one provider reported them fresh under different names.
    [[nodiscard]] bool compatible(std::size_t root_a, std::size_t root_b) const
    {
        for (const auto& [provider, name] : m_claims[root_a])
        {
            const auto it = m_claims[root_b].find(provider);
            if (it != m_claims[root_b].end() && it->second != name)
            {
                return false;
            }
        }
        return true;
    }

    /// Join two roots; the larger cluster (then the lower index) stays root.
    void unite(std::size_t root_a, std::size_t root_b)
    {
        if (m_size[root_b] > m_size[root_a] || (m_size[root_b] == m_size[root_a] && root_b < root_a))
        {
            std::swap(root_a, root_b);
        }
        m_parent[root_b] = root_a;
        m_size[root_a] += m_size[root_b];
        m_claims[root_a].insert(m_claims[root_b].begin(), m_claims[root_b].end());
        m_claims[root_b].clear();
    }

    [[nodiscard]] std::size_t size_of(std::size_t root) const { return m_size[root]; }

private:
    std::vector<std::size_t>                       m_parent;
    std::vector<std::size_t>                       m_size;
    std::vector<std::map<ProviderId, std::string>> m_claims;
};

/// Candidate match. Name-based edges sort before positional ones.
struct Edge
{
    u8          rank = 0;           ///< 0: alias or designation, 1: position
    f64         separation = 0.0;   ///< arcsec, positional edges only
    std::size_t a = 0;
    std::size_t b = 0;

    bool operator<(const Edge& o) const
    {
        return std::tie(rank, separation, a, b) < std::tie(o.rank, o.separation, o.a, o.b);
    }
};

bool shares_provider(const Target& a, const Target& b)
{
    return std::any_of(a.contributing_sources.begin(), a.contributing_sources.end(),
                       [&b](ProviderId p) { return b.contributing_sources.contains(p); });
}

bool declares_alias(const Target& a, const Target& b)
{
    return std::any_of(a.aliases.begin(), a.aliases.end(),
                       [&b](const std::string& alias) { return target::iequals(alias, b.designation); });
}

} // anonymous namespace

Deduplicator::Deduplicator(core::DedupConfig config)
    : m_config(config)
{
}

bool Deduplicator::matches(const Target& a, const Target& b) const
{
    if (declares_alias(a, b) || declares_alias(b, a))
    {
        return true;
    }
    if (target::iequals(a.designation, b.designation) && shares_provider(a, b))
    {
        return true;
    }

    const f64 sep_arcsec = astro::Coordinates::angular_separation_deg(a.ra_deg, a.dec_deg, b.ra_deg, b.dec_deg) * 3600.0;
    const auto dt = a.epoch > b.epoch ? a.epoch - b.epoch : b.epoch - a.epoch;
    return sep_arcsec < m_config.match_radius_arcsec && dt <= m_config.epoch_window;
}

Target Deduplicator::merge(const std::vector<Target>& records)
{
    if (records.empty())
    {
        return Target{};
    }

    std::vector<Entry> entries;
    entries.reserve(records.size());
    for (const auto& r : records)
    {
        entries.push_back(Entry{.record = &r, .fresh = true});
    }
    std::sort(entries.begin(), entries.end(), canonical_less);
    return merge_members(entries);
}

// -----------------------------------------------------------------
// deduplicate
//
//   1. canonical order over fresh ∪ previous
//   2. candidate edges: alias/designation maps, sky-index radius queries
//   3. Kruskal-style union in edge order, refusing incompatible joins
//   4. merge each cluster; apply the retention rule to previous-only clusters
// -----------------------------------------------------------------

DedupResult Deduplicator::deduplicate(const std::vector<Target>& fresh,
                                      const std::vector<Target>& previous,
                                      const std::set<ProviderId>& failed_providers) const
{
    DedupResult result;

    std::vector<Entry> entries;
    entries.reserve(fresh.size() + previous.size());
    for (const auto& t : fresh)
    {
        entries.push_back(Entry{.record = &t, .fresh = true});
    }
    for (const auto& t : previous)
    {
        entries.push_back(Entry{.record = &t, .fresh = false});
    }
    std::sort(entries.begin(), entries.end(), canonical_less);

    // ---- Candidate edges ----
    std::vector<Edge> edges;

    std::unordered_map<std::string, std::vector<std::size_t>> by_name;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        by_name[lowercase(entries[i].record->designation)].push_back(i);
    }

    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        const Target& t = *entries[i].record;

        // Rule (b): declared cross-identifications.
        for (const auto& alias : t.aliases)
        {
            const auto it = by_name.find(lowercase(alias));
            if (it == by_name.end())
            {
                continue;
            }
            for (const std::size_t j : it->second)
            {
                if (j != i)
                {
                    edges.push_back(Edge{.rank = 0, .a = std::min(i, j), .b = std::max(i, j)});
                }
            }
        }

        // Rule (c): same designation re-reported by a shared provider.
        for (const std::size_t j : by_name[lowercase(t.designation)])
        {
            if (j > i && shares_provider(t, *entries[j].record))
            {
                edges.push_back(Edge{.rank = 0, .a = i, .b = j});
            }
        }
    }

    // Rule (a): positional coincidence within the epoch window.
    const f64 radius_deg = m_config.match_radius_arcsec / 3600.0;
    SkyIndex index(std::max(60.0 * radius_deg, 1.0 / 60.0));
    for (const Entry& e : entries)
    {
        index.insert(e.record->ra_deg, e.record->dec_deg);
    }

    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        const Target& a = *entries[i].record;
        for (const std::size_t j : index.query(a.ra_deg, a.dec_deg, radius_deg))
        {
            if (j <= i)
            {
                continue;
            }
            const Target& b = *entries[j].record;
            const auto dt = a.epoch > b.epoch ? a.epoch - b.epoch : b.epoch - a.epoch;
            if (dt > m_config.epoch_window)
            {
                continue;
            }
            const f64 sep = astro::Coordinates::angular_separation_deg(a.ra_deg, a.dec_deg, b.ra_deg, b.dec_deg) * 3600.0;
            if (sep < m_config.match_radius_arcsec)
            {
                edges.push_back(Edge{.rank = 1, .separation = sep, .a = i, .b = j});
            }
        }
    }

    std::sort(edges.begin(), edges.end());

    // ---- Clustering ----
    Clusters clusters(entries);
    std::set<std::pair<std::size_t, std::size_t>> refused;

    for (const Edge& edge : edges)
    {
        const std::size_t ra = clusters.find(edge.a);
        const std::size_t rb = clusters.find(edge.b);
        if (ra == rb)
        {
            continue;
        }

        if (!clusters.compatible(ra, rb))
        {
            if (refused.emplace(std::min(ra, rb), std::max(ra, rb)).second)
            {
                const bool a_larger = clusters.size_of(ra) >= clusters.size_of(rb);
                NPL_CORE_WARN("DeduplicationAmbiguity: '{}' and '{}' match but were reported "
                              "separately by the same provider; keeping '{}' as a separate target",
                              entries[edge.a].record->designation, entries[edge.b].record->designation,
                              a_larger ? entries[edge.b].record->designation
                                       : entries[edge.a].record->designation);
                ++result.ambiguities;
            }
            continue;
        }

        clusters.unite(ra, rb);
    }

    // ---- Merge ----
    std::map<std::size_t, std::vector<Entry>> members;   // root -> members in canonical order
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        members[clusters.find(i)].push_back(entries[i]);
    }

    for (const auto& [root, group] : members)
    {
        const bool has_fresh = std::any_of(group.begin(), group.end(),
                                           [](const Entry& e) { return e.fresh; });
        if (!has_fresh)
        {
            const bool source_failed = std::any_of(group.begin(), group.end(), [&](const Entry& e) {
                return std::any_of(e.record->contributing_sources.begin(),
                                   e.record->contributing_sources.end(),
                                   [&](ProviderId p) { return failed_providers.contains(p); });
            });
            if (!source_failed)
            {
                NPL_CORE_DEBUG("Deduplicator: dropping '{}', no longer reported",
                               group.front().record->designation);
                ++result.dropped;
                continue;
            }
            ++result.retained;
        }

        result.targets.push_back(merge_members(group));
    }

    std::sort(result.targets.begin(), result.targets.end(), [](const Target& a, const Target& b) {
        return std::tie(a.designation, a.source, a.epoch, a.ra_deg, a.dec_deg)
             < std::tie(b.designation, b.source, b.epoch, b.ra_deg, b.dec_deg);
    });

    NPL_CORE_INFO("Deduplicator: {} fresh + {} previous -> {} targets ({} retained, {} dropped, {} ambiguous)",
                  fresh.size(), previous.size(), result.targets.size(),
                  result.retained, result.dropped, result.ambiguities);

    return result;
}

} // namespace neoplan::pipeline
