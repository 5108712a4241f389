#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "flower/types.hpp"

namespace flower {

/**
 * @brief Scatter @p count segments uniformly over a @p width_m by @p height_m area.
 *
 * The same seed always yields the same field.
 */
[[nodiscard]] std::vector<Point2> generate_segment_field(std::size_t count, double width_m, double height_m, std::uint32_t seed);

}  // namespace flower
