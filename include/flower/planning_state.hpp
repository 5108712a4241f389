// === Planning State ==========================================================
//
// Everything one planning run owns and mutates in place: the grid with its
// per-cell stamps, the cover, the virtual clusters, the tours and the hub.
// Components receive the state by reference; nothing in it is shared across
// runs.

#pragma once

#include <utility>
#include <vector>

#include "flower/cluster.hpp"
#include "flower/grid.hpp"

namespace flower {

/** @brief Mutable state of a single planning run. */
struct PlanningState final {
    explicit PlanningState(Grid grid_in);

    Grid grid;                                     /**< Lattice, segments and cell stamps. */
    std::vector<CellId> cover{};                   /**< Cover cells in selection order. */
    VirtualHub virtual_hub{};                      /**< Damaged-area centre. */
    std::vector<VirtualCluster> virtual_clusters{}; /**< Provisional groupings, id order. */
    std::vector<Cluster> clusters{};               /**< Real tours, id order. */
    Hub hub;                                       /**< Central tour. */

    /** @brief Take ownership of the cover produced by the coverage selector. */
    void install_cover(std::vector<CellId> cover_cells);
    /** @brief Take ownership of relabelled virtual clusters and give the hub the next id. */
    void install_virtual_clusters(std::vector<VirtualCluster> list_virtual_clusters);

    /** @brief Tours in id order followed by the hub. */
    [[nodiscard]] std::vector<Cluster*> all_clusters();
    [[nodiscard]] std::vector<const Cluster*> all_clusters() const;
    [[nodiscard]] Cluster* find_cluster(int id);
    [[nodiscard]] const Cluster* find_cluster(int id) const;
    [[nodiscard]] const VirtualCluster* find_virtual_cluster(int id) const;

    /** @brief Cover cells not yet stamped with a tour id, in cover order. */
    [[nodiscard]] std::vector<CellId> unassigned_cells() const;
    /** @brief Hub cells tours attach to; the placeholder stands in for an empty hub. */
    [[nodiscard]] std::vector<CellId> hub_attachment_cells() const;
    /** @brief The tour's anchor, or the first hub attachment cell before anchors are set. */
    [[nodiscard]] CellId attachment_cell(const Cluster& cluster) const;
    /** @brief Point every tour's anchor at the hub attachment cell nearest to it. */
    void refresh_anchors();
};

}  // namespace flower
