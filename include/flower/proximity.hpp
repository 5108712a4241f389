// === Proximity ===============================================================
//
// Nearest-node search over grid cells. Distances are measured between cell
// centres; the first pair in iteration order wins ties so results are stable.

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "flower/grid.hpp"
#include "flower/types.hpp"

namespace flower {

/**
 * @brief Pair (one from each side) of cells with minimal centre distance.
 *
 * @return std::nullopt when either collection is empty.
 */
[[nodiscard]] std::optional<std::pair<CellId, CellId>> closest_nodes(
    const Grid& grid,
    const std::vector<CellId>& lhs,
    const std::vector<CellId>& rhs
);

/** @brief Cell of @p cells whose centre is nearest @p point. */
[[nodiscard]] std::optional<CellId> closest_node(const Grid& grid, const std::vector<CellId>& cells, const Point2& point);

/** @brief Mean of the cell centres; the origin for an empty collection. */
[[nodiscard]] Point2 centroid(const Grid& grid, const std::vector<CellId>& cells);

}  // namespace flower
