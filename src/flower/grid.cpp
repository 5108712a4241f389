#include "flower/grid.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <set>
#include <stdexcept>

namespace flower {

namespace {

/**
 * @brief Cell side length for which the centre reaches every point of the cell.
 */
double derive_cell_size_m(double comms_range_m) {
    return comms_range_m / std::numbers::sqrt2;
}

void validate_config(const GridConfig& config) {
    if (config.width_m <= 0.0 || config.height_m <= 0.0) {
        throw std::invalid_argument("Grid area dimensions must be positive");
    }
    if (config.comms_range_m <= 0.0) {
        throw std::invalid_argument("Grid communication range must be positive");
    }
}

}  // namespace

Grid::Grid(GridConfig config, const std::vector<Point2>& segment_locations)
    : config_(config),
      cell_size_m_(0.0) {
    validate_config(config_);
    if (segment_locations.empty()) {
        throw std::invalid_argument("Grid requires at least one segment");
    }

    cell_size_m_ = derive_cell_size_m(config_.comms_range_m);
    cols_ = std::max(1, static_cast<int>(std::ceil(config_.width_m / cell_size_m_)));
    rows_ = std::max(1, static_cast<int>(std::ceil(config_.height_m / cell_size_m_)));

    list_segments_.reserve(segment_locations.size());
    for (const Point2& location : segment_locations) {
        if (location.x_m < 0.0 || location.x_m > config_.width_m || location.y_m < 0.0 || location.y_m > config_.height_m) {
            throw std::invalid_argument("Segment location lies outside the damaged area");
        }
        list_segments_.push_back(Segment{list_segments_.size(), location, std::nullopt});
    }

    build_cells();
    derive_cell_metrics();
}

const GridConfig& Grid::config() const noexcept {
    return config_;
}

double Grid::cell_size_m() const noexcept {
    return cell_size_m_;
}

int Grid::rows() const noexcept {
    return rows_;
}

int Grid::cols() const noexcept {
    return cols_;
}

const std::vector<Cell>& Grid::cells() const noexcept {
    return list_cells_;
}

const Cell& Grid::cell(CellId id) const {
    return list_cells_.at(id);
}

Cell& Grid::cell(CellId id) {
    return list_cells_.at(id);
}

std::optional<CellId> Grid::cell_at(int row, int col) const {
    if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
        return std::nullopt;
    }
    return static_cast<CellId>(row) * static_cast<CellId>(cols_) + static_cast<CellId>(col);
}

CellId Grid::center() const noexcept {
    return static_cast<CellId>(rows_ / 2) * static_cast<CellId>(cols_) + static_cast<CellId>(cols_ / 2);
}

int Grid::cell_distance(const Cell& lhs, const Cell& rhs) noexcept {
    return std::max(std::abs(lhs.row - rhs.row), std::abs(lhs.col - rhs.col));
}

std::vector<CellId> Grid::cell_neighbors(int row, int col, int radius) const {
    std::vector<CellId> ring;
    if (radius <= 0) {
        return ring;
    }
    for (int ring_row = row - radius; ring_row <= row + radius; ++ring_row) {
        for (int ring_col = col - radius; ring_col <= col + radius; ++ring_col) {
            if (std::max(std::abs(ring_row - row), std::abs(ring_col - col)) != radius) {
                continue;
            }
            if (const auto id = cell_at(ring_row, ring_col); id.has_value()) {
                ring.push_back(id.value());
            }
        }
    }
    return ring;
}

const std::vector<Segment>& Grid::segments() const noexcept {
    return list_segments_;
}

const Segment& Grid::segment(SegmentId id) const {
    return list_segments_.at(id);
}

void Grid::bind_segment(SegmentId segment, CellId cell) {
    list_segments_.at(segment).cover_cell = cell;
}

void Grid::build_cells() {
    list_cells_.reserve(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_));
    for (int row = 0; row < rows_; ++row) {
        for (int col = 0; col < cols_; ++col) {
            Cell cell{};
            cell.id = list_cells_.size();
            cell.row = row;
            cell.col = col;
            cell.location = Point2{(col + 0.5) * cell_size_m_, (row + 0.5) * cell_size_m_};
            for (const Segment& segment : list_segments_) {
                if (distance_m(cell.location, segment.location) <= config_.comms_range_m) {
                    cell.segments.push_back(segment.id);
                }
            }
            cell.access = cell.segments.size();
            list_cells_.push_back(std::move(cell));
        }
    }
}

void Grid::derive_cell_metrics() {
    const Cell& center_cell = list_cells_.at(center());
    const int center_row = center_cell.row;
    const int center_col = center_cell.col;

    for (Cell& cell : list_cells_) {
        cell.neighbors = cell_neighbors(cell.row, cell.col, 1);
        cell.proximity = std::max(std::abs(cell.row - center_row), std::abs(cell.col - center_col));
    }

    for (Cell& cell : list_cells_) {
        std::set<SegmentId> set_hop_segments;
        for (const CellId neighbor : cell.neighbors) {
            const Cell& neighbor_cell = list_cells_[neighbor];
            set_hop_segments.insert(neighbor_cell.segments.begin(), neighbor_cell.segments.end());
        }
        cell.signal_hop_count = set_hop_segments.size();
    }
}

}  // namespace flower
