// === Tour Planner ============================================================
//
// Single planning entry point. Builds the grid from the segment locations,
// selects the cover, forms virtual clusters, picks a strategy from the energy
// balance and runs growth/balancing accordingly. Any planning error aborts the
// run; there is no partial result.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>

#include "flower/branch_selector.hpp"
#include "flower/energy_balancer.hpp"
#include "flower/energy_model.hpp"
#include "flower/grid.hpp"
#include "flower/planning_state.hpp"
#include "flower/types.hpp"

namespace flower {

/**
 * @brief Tunable parameters of a planning run.
 *
 * Populated at startup by the configuration loader (or directly by tests) and
 * treated as immutable during planning.
 */
struct PlannerConfig final {
    GridConfig grid{};
    int agent_count{};
    std::size_t max_balance_rounds{k_default_max_balance_rounds};
    double dominance_ratio{k_default_dominance_ratio};
    EnergyConfig energy{};
};

/**
 * @brief Finalised tours, the hub and the diagnostics gathered on the way.
 */
struct PlanResult final {
    PlanningState state;                        /**< Grid, cover, virtual clusters, tours and hub. */
    PlanningBranch branch{PlanningBranch::Balanced}; /**< Strategy that ran. */
    double initial_movement_j{};                /**< Whole-field movement energy before clustering. */
    double initial_comms_j{};                   /**< Whole-field communication energy before clustering. */
    double final_movement_j{};                  /**< Movement energy of the final tours. */
    double final_comms_j{};                     /**< Communication energy of the final tours. */
    std::size_t growth_rounds{};                /**< Greedy expansion rounds (balanced branch only). */
    std::optional<BalanceReport> balance{};     /**< Balancer outcome, when a pass ran. */
    bool movement_sharing_needed{};             /**< Final tours are still movement-dominated. */
    bool comms_sharing_needed{};                /**< Final tours are still communication-dominated. */
};

/** @brief Plans the data-collection tours for one sensor field. */
class TourPlanner final {
  public:
    TourPlanner(PlannerConfig config, std::shared_ptr<const EnergyModel> energy_model, std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] const PlannerConfig& config() const noexcept;

    /**
     * @brief Run the full planning pipeline for @p segment_locations.
     *
     * @throws PlanningError subclasses on fatal planning failures.
     * @throws std::invalid_argument if the field does not fit the configured area.
     */
    [[nodiscard]] PlanResult plan(const std::vector<Point2>& segment_locations) const;

  private:
    void log_summary(const PlanResult& result) const;

    PlannerConfig config_;
    std::shared_ptr<const EnergyModel> energy_model_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flower
