// === Cluster Growth ==========================================================
//
// Turns virtual clusters into real tours. When movement dominates the virtual
// grouping is adopted as is; otherwise tours (and the hub) are grown one cell
// per round, always extending the currently cheapest one. Growth ends by
// exhaustion: every stalled tour is marked completed, nothing is thrown.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>

#include "flower/energy_model.hpp"
#include "flower/planning_state.hpp"

namespace flower {

/**
 * @brief Result of extending one tour by a single cell.
 */
enum class GrowthOutcome {
    Grew,       /**< A cell was added to the tour. */
    Collision,  /**< The ring search hit a cell owned by the neighbouring tour; the tour completed. */
    Exhausted   /**< No candidate cell remained; the tour completed. */
};

/** @brief Assigns cover cells to tours. */
class ClusterGrowthEngine final {
  public:
    ClusterGrowthEngine(const EnergyModel& energy_model, std::shared_ptr<spdlog::logger> logger);

    /** @brief One tour per virtual cluster with identical id and membership. */
    void map_virtual_clusters(PlanningState& state) const;

    /**
     * @brief Grow tours from the cells nearest the hub until every cluster completes.
     *
     * @return Number of growth rounds, the bootstrap round included.
     */
    std::size_t greedy_expansion(PlanningState& state) const;

    /**
     * @brief Extend @p cluster with its own unassigned virtual cell nearest its recent cell,
     * else with the first cell the ring search finds in an adjacent virtual cluster.
     *
     * Collision and Exhausted mark the tour completed.
     */
    GrowthOutcome grow_tour(PlanningState& state, Cluster& cluster, std::size_t round) const;

  private:
    /** @brief Outcome of the ring search around a tour's recent cell. */
    struct AdjacentCell final {
        std::optional<CellId> cell{};
        bool collision{};
    };

    void grow_hub(PlanningState& state, const std::vector<CellId>& unassigned, std::size_t round) const;
    AdjacentCell search_adjacent_cells(const PlanningState& state, const Cluster& cluster, CellId origin) const;

    const EnergyModel& energy_model_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flower
