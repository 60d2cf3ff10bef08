/// @file sky_index.cpp
/// @brief SkyIndex implementation.

#include "pipeline/sky_index.hpp"

#include "astro/coordinates.hpp"

#include <algorithm>
#include <cmath>

namespace neoplan::pipeline
{

SkyIndex::SkyIndex(f64 cell_deg)
    : m_cell_deg(cell_deg > 0.0 ? cell_deg : 1.0)
    , m_ra_cells(std::max(1, static_cast<i32>(std::ceil(360.0 / m_cell_deg))))
    , m_dec_cells(std::max(1, static_cast<i32>(std::ceil(180.0 / m_cell_deg))))
{
}

std::pair<i32, i32> SkyIndex::cell_for(f64 ra_deg, f64 dec_deg) const
{
    const i32 ra  = static_cast<i32>(std::floor(ra_deg / m_cell_deg));
    const i32 dec = static_cast<i32>(std::floor((dec_deg + 90.0) / m_cell_deg));
    return {((ra % m_ra_cells) + m_ra_cells) % m_ra_cells, std::clamp(dec, 0, m_dec_cells - 1)};
}

std::size_t SkyIndex::insert(f64 ra_deg, f64 dec_deg)
{
    const std::size_t idx = m_positions.size();
    m_positions.emplace_back(ra_deg, dec_deg);

    const auto [ra_c, dec_c] = cell_for(ra_deg, dec_deg);
    m_grid[cell_key(ra_c, dec_c)].push_back(idx);
    return idx;
}

// -----------------------------------------------------------------
// query
//
// Dec bands: those overlapping [dec − r, dec + r].
// RA cells:  ±r / cos(|dec| + r) around the centre, wrapped at 360°;
//            every cell of the band once that span reaches the pole.
// -----------------------------------------------------------------

std::vector<std::size_t> SkyIndex::query(f64 ra_deg, f64 dec_deg, f64 radius_deg) const
{
    std::vector<std::size_t> result;

    const i32 dec_lo = std::clamp(static_cast<i32>(std::floor((dec_deg - radius_deg + 90.0) / m_cell_deg)),
                                  0, m_dec_cells - 1);
    const i32 dec_hi = std::clamp(static_cast<i32>(std::floor((dec_deg + radius_deg + 90.0) / m_cell_deg)),
                                  0, m_dec_cells - 1);

    const f64 extreme_dec = std::min(90.0, std::abs(dec_deg) + radius_deg);
    const f64 cos_dec = std::cos(extreme_dec * astro_constants::kDegToRad);

    i32 ra_first = 0;
    i32 ra_count = m_ra_cells;
    if (cos_dec > 1e-6)
    {
        const f64 span = radius_deg / cos_dec;
        const i32 lo = static_cast<i32>(std::floor((ra_deg - span) / m_cell_deg));
        const i32 hi = static_cast<i32>(std::floor((ra_deg + span) / m_cell_deg));
        if (hi - lo + 1 < m_ra_cells)
        {
            ra_first = lo;
            ra_count = hi - lo + 1;
        }
    }

    for (i32 dec_cell = dec_lo; dec_cell <= dec_hi; ++dec_cell)
    {
        for (i32 k = 0; k < ra_count; ++k)
        {
            const i32 ra_cell = (((ra_first + k) % m_ra_cells) + m_ra_cells) % m_ra_cells;

            const auto it = m_grid.find(cell_key(ra_cell, dec_cell));
            if (it == m_grid.end())
            {
                continue;
            }

            for (const std::size_t idx : it->second)
            {
                const auto& [ra, dec] = m_positions[idx];
                if (astro::Coordinates::angular_separation_deg(ra_deg, dec_deg, ra, dec) <= radius_deg)
                {
                    result.push_back(idx);
                }
            }
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

} // namespace neoplan::pipeline
