#include "flower/proximity.hpp"

#include <limits>

namespace flower {

std::optional<std::pair<CellId, CellId>> closest_nodes(
    const Grid& grid,
    const std::vector<CellId>& lhs,
    const std::vector<CellId>& rhs
) {
    std::optional<std::pair<CellId, CellId>> best_pair;
    double best_distance_m = std::numeric_limits<double>::infinity();
    for (const CellId lhs_cell : lhs) {
        const Point2& lhs_location = grid.cell(lhs_cell).location;
        for (const CellId rhs_cell : rhs) {
            const double candidate_m = distance_m(lhs_location, grid.cell(rhs_cell).location);
            if (candidate_m < best_distance_m) {
                best_distance_m = candidate_m;
                best_pair = std::make_pair(lhs_cell, rhs_cell);
            }
        }
    }
    return best_pair;
}

std::optional<CellId> closest_node(const Grid& grid, const std::vector<CellId>& cells, const Point2& point) {
    std::optional<CellId> best_cell;
    double best_distance_m = std::numeric_limits<double>::infinity();
    for (const CellId cell : cells) {
        const double candidate_m = distance_m(grid.cell(cell).location, point);
        if (candidate_m < best_distance_m) {
            best_distance_m = candidate_m;
            best_cell = cell;
        }
    }
    return best_cell;
}

Point2 centroid(const Grid& grid, const std::vector<CellId>& cells) {
    if (cells.empty()) {
        return Point2{};
    }
    double sum_x_m = 0.0;
    double sum_y_m = 0.0;
    for (const CellId cell : cells) {
        const Point2& location = grid.cell(cell).location;
        sum_x_m += location.x_m;
        sum_y_m += location.y_m;
    }
    const auto count = static_cast<double>(cells.size());
    return Point2{sum_x_m / count, sum_y_m / count};
}

}  // namespace flower
