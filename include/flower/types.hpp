// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the planner (identifiers, planar coordinates, branch selection, etc.).

#pragma once

#include <cmath>
#include <cstddef>
#include <string_view>

namespace flower {

/**
 * @brief Index of a cell inside the grid (row-major).
 */
using CellId = std::size_t;

/**
 * @brief Index of a segment inside the sensor field.
 */
using SegmentId = std::size_t;

/**
 * @brief Sentinel tour identifier for cells not yet assigned to any cluster.
 */
inline constexpr int k_not_clustered{-1};

/**
 * @brief Planar position in metres relative to the south-west area corner.
 */
struct Point2 final {
    double x_m{};  /**< Easting in metres. */
    double y_m{};  /**< Northing in metres. */
};

/**
 * @brief Euclidean distance between two planar points.
 */
inline double distance_m(const Point2& from, const Point2& to) {
    return std::hypot(to.x_m - from.x_m, to.y_m - from.y_m);
}

/**
 * @brief Enumerates the three planning strategies chosen from the energy balance.
 */
enum class PlanningBranch {
    MovementDominant,       /**< Movement energy dwarfs communication energy. */
    CommunicationDominant,  /**< Communication energy dwarfs movement energy. */
    Balanced                /**< Neither cost dominates. */
};

/**
 * @brief Short stable name for a planning branch, used in structured logs.
 */
constexpr std::string_view to_string(PlanningBranch branch) {
    switch (branch) {
        case PlanningBranch::MovementDominant:
            return "movement_dominant";
        case PlanningBranch::CommunicationDominant:
            return "communication_dominant";
        case PlanningBranch::Balanced:
            return "balanced";
    }
    return "unknown";
}

}  // namespace flower
