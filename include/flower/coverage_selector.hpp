// === Coverage Selector =======================================================
//
// Greedy weighted set cover over the grid: picks the cells that together reach
// every segment, preferring cells that add the most uncovered segments and,
// on ties, cells that are less crowded, better connected and closer to the
// damaged-area centre.

#pragma once

#include <memory>
#include <vector>

#include <spdlog/logger.h>

#include "flower/grid.hpp"

namespace flower {

/**
 * @brief Strict preference of @p cell over the current @p candidate when both add
 * the same number of uncovered segments.
 *
 * Lower access wins, then higher signal hop count, then lower proximity. A full
 * tie keeps the candidate, which was visited first (lower id).
 */
[[nodiscard]] bool wins_tie_break(const Cell& cell, const Cell& candidate) noexcept;

/** @brief Selects the rendezvous cells and binds each segment to one of them. */
class CoverageSelector final {
  public:
    explicit CoverageSelector(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Compute the cover and bind every segment to its covering cell.
     *
     * @param grid Lattice whose segments are bound as a side effect.
     * @param agent_count Number of relay agents the cover must exceed.
     * @return Cover cells in selection order.
     * @throws UncoverableSegmentError if no eligible cell reaches some segment.
     * @throws InsufficientCoverError if the cover is not larger than @p agent_count.
     */
    [[nodiscard]] std::vector<CellId> select(Grid& grid, int agent_count) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flower
