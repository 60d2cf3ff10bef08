#pragma once

/// @file sky_index.hpp
/// @brief Declination-band / RA-cell grid for radius queries over many positions.

#include "core/types.hpp"

#include <unordered_map>
#include <utility>
#include <vector>

namespace neoplan::pipeline
{
    /// @brief Grid index over (RA, Dec) in degrees.
    ///
    /// Positions are bucketed into cells of `cell_deg` on a side. A radius
    /// query visits only the cells the search circle can touch, widening the
    /// RA span by 1/cos(dec) and falling back to the whole band near the poles.
    class SkyIndex
    {
    public:
        explicit SkyIndex(f64 cell_deg = 1.0);

        /// @brief Add a position.
        /// @return Its index, assigned sequentially from 0.
        std::size_t insert(f64 ra_deg, f64 dec_deg);

        /// @brief Indices of all positions within `radius_deg` of the centre, ascending.
        [[nodiscard]] std::vector<std::size_t> query(f64 ra_deg, f64 dec_deg, f64 radius_deg) const;

        [[nodiscard]] std::size_t size() const { return m_positions.size(); }

    private:
        using CellKey = u32;

        [[nodiscard]] static CellKey cell_key(i32 ra_cell, i32 dec_cell)
        {
            return (static_cast<u32>(ra_cell) & 0xFFFFu) << 16 | (static_cast<u32>(dec_cell) & 0xFFFFu);
        }

        [[nodiscard]] std::pair<i32, i32> cell_for(f64 ra_deg, f64 dec_deg) const;

        f64 m_cell_deg;
        i32 m_ra_cells;
        i32 m_dec_cells;

        std::vector<std::pair<f64, f64>>                       m_positions;
        std::unordered_map<CellKey, std::vector<std::size_t>> m_grid;
    };

} // namespace neoplan::pipeline
