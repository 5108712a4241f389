#include "flower/coverage_selector.hpp"

#include <optional>
#include <vector>

#include <fmt/format.h>

#include "flower/errors.hpp"

namespace flower {

namespace {

/**
 * @brief Number of @p cell segments not yet marked in @p covered.
 */
std::size_t count_new_segments(const Cell& cell, const std::vector<bool>& covered) {
    std::size_t count = 0;
    for (const SegmentId segment : cell.segments) {
        if (!covered[segment]) {
            ++count;
        }
    }
    return count;
}

}  // namespace

bool wins_tie_break(const Cell& cell, const Cell& candidate) noexcept {
    if (cell.access != candidate.access) {
        return cell.access < candidate.access;
    }
    if (cell.signal_hop_count != candidate.signal_hop_count) {
        return cell.signal_hop_count > candidate.signal_hop_count;
    }
    return cell.proximity < candidate.proximity;
}

CoverageSelector::CoverageSelector(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::vector<CellId> CoverageSelector::select(Grid& grid, int agent_count) const {
    const std::vector<Cell>& list_cells = grid.cells();
    const std::size_t segment_count = grid.segments().size();
    const CellId damaged_cell = grid.center();

    std::vector<bool> covered(segment_count, false);
    std::size_t covered_count = 0;
    std::vector<CellId> list_cover;

    while (covered_count < segment_count) {
        std::optional<CellId> candidate;
        std::size_t candidate_gain = 0;

        for (const Cell& cell : list_cells) {
            if (cell.access == 0) {
                continue;
            }
            if (list_cover.empty()) {
                candidate = cell.id;
                candidate_gain = count_new_segments(cell, covered);
                break;
            }
            if (cell.id == damaged_cell) {
                continue;
            }

            const std::size_t gain = count_new_segments(cell, covered);
            if (!candidate.has_value() || gain > candidate_gain) {
                candidate = cell.id;
                candidate_gain = gain;
                continue;
            }
            if (gain == candidate_gain && wins_tie_break(cell, list_cells[candidate.value()])) {
                candidate = cell.id;
            }
        }

        if (!candidate.has_value() || candidate_gain == 0) {
            throw UncoverableSegmentError(fmt::format(
                "{} of {} segments cannot be reached by any eligible cell",
                segment_count - covered_count,
                segment_count
            ));
        }

        for (const SegmentId segment : list_cells[candidate.value()].segments) {
            if (!covered[segment]) {
                covered[segment] = true;
                ++covered_count;
            }
        }
        list_cover.push_back(candidate.value());
        logger_->debug(
            R"({{"component":"coverage","cell":{},"gain":{},"covered":{}}})",
            candidate.value(),
            candidate_gain,
            covered_count
        );
    }

    logger_->info(R"({{"component":"coverage","cover_cells":{},"segments":{}}})", list_cover.size(), segment_count);

    if (static_cast<int>(list_cover.size()) <= agent_count) {
        throw InsufficientCoverError(fmt::format(
            "Cover of {} cells cannot serve {} relay agents",
            list_cover.size(),
            agent_count
        ));
    }

    std::vector<bool> bound(segment_count, false);
    for (const CellId cell : list_cover) {
        for (const SegmentId segment : list_cells[cell].segments) {
            if (!bound[segment]) {
                grid.bind_segment(segment, cell);
                bound[segment] = true;
            }
        }
    }

    return list_cover;
}

}  // namespace flower
