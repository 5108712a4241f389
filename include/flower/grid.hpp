// === Grid ====================================================================
//
// Partitions the damaged area into square cells sized from the communication
// range, records which segments each cell can reach and exposes the lattice
// geometry (neighbour sets, ring enumeration, cell distance) used by the
// planner. Cells are owned here; the planner only stamps tour ids on them.

#pragma once

#include <optional>
#include <vector>

#include "flower/segment.hpp"
#include "flower/types.hpp"

namespace flower {

/**
 * @brief Dimensions of the damaged area and the radio range of the segments.
 */
struct GridConfig final {
    double width_m{};        /**< Extent of the area along x in metres. */
    double height_m{};       /**< Extent of the area along y in metres. */
    double comms_range_m{};  /**< Range within which a cell can talk to a segment. */
};

/**
 * @brief A unit of the spatial grid that can serve as a rendezvous point.
 */
struct Cell final {
    CellId id{};                              /**< Row-major index. */
    int row{};                                /**< Lattice row. */
    int col{};                                /**< Lattice column. */
    Point2 location{};                        /**< Centre of the cell. */
    std::vector<SegmentId> segments{};        /**< Segments within range, ascending. */
    std::vector<CellId> neighbors{};          /**< 8-connected neighbours, ascending. */
    std::size_t access{};                     /**< Number of reachable segments; zero means unusable. */
    int proximity{};                          /**< Lattice distance to the damaged-area centre. */
    std::size_t signal_hop_count{};           /**< Distinct segments reachable from one-hop neighbours. */
    int tour_id{k_not_clustered};             /**< Cluster currently owning the cell. */
    int virtual_tour_id{k_not_clustered};     /**< Virtual cluster the cell was grouped into. */
};

/** @brief Square lattice over the damaged area together with its segments. */
class Grid final {
  public:
    /**
     * @brief Build the lattice and derive per-cell reach, proximity and hop counts.
     *
     * @param config Area dimensions and communication range.
     * @param segment_locations Sensor sites; each must lie inside the area.
     */
    Grid(GridConfig config, const std::vector<Point2>& segment_locations);

    [[nodiscard]] const GridConfig& config() const noexcept;
    /** @brief Side length of a cell in metres. */
    [[nodiscard]] double cell_size_m() const noexcept;
    [[nodiscard]] int rows() const noexcept;
    [[nodiscard]] int cols() const noexcept;

    [[nodiscard]] const std::vector<Cell>& cells() const noexcept;
    [[nodiscard]] const Cell& cell(CellId id) const;
    [[nodiscard]] Cell& cell(CellId id);
    /** @brief Cell at @p row / @p col, if the coordinates fall inside the lattice. */
    [[nodiscard]] std::optional<CellId> cell_at(int row, int col) const;

    /** @brief The cell at the centre of the damaged area (the hub placeholder). */
    [[nodiscard]] CellId center() const noexcept;

    /** @brief Chebyshev lattice distance between two cells. */
    [[nodiscard]] static int cell_distance(const Cell& lhs, const Cell& rhs) noexcept;
    /** @brief Cells on the ring at exactly @p radius around @p row / @p col, row-major. */
    [[nodiscard]] std::vector<CellId> cell_neighbors(int row, int col, int radius) const;

    [[nodiscard]] const std::vector<Segment>& segments() const noexcept;
    [[nodiscard]] const Segment& segment(SegmentId id) const;
    /** @brief Record @p cell as the cover cell serving @p segment. */
    void bind_segment(SegmentId segment, CellId cell);

  private:
    void build_cells();
    void derive_cell_metrics();

    GridConfig config_;
    double cell_size_m_;
    int rows_{};
    int cols_{};
    std::vector<Segment> list_segments_;
    std::vector<Cell> list_cells_;
};

}  // namespace flower
