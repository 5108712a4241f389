#pragma once

#include <optional>

#include "flower/types.hpp"

namespace flower {

/**
 * @brief A fixed sensor site that must be reached by some collection cell.
 */
struct Segment final {
    SegmentId id{};                     /**< Index of the segment inside the field. */
    Point2 location{};                  /**< Fixed position of the sensor site. */
    std::optional<CellId> cover_cell{}; /**< Cover cell the segment is bound to, once selected. */
};

}  // namespace flower
