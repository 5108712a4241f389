// === Energy Model ============================================================
//
// Abstract cost seam between the planner and the physics of the mission, plus
// the default model. Costs are pure functions of the planning state handed in;
// the planner calls them repeatedly inside its optimisation loops.

#pragma once

#include <memory>
#include <vector>

#include "flower/planning_state.hpp"
#include "flower/types.hpp"

namespace flower {

/** @brief Per-tour and whole-configuration energy costs. */
class EnergyModel {
  public:
    virtual ~EnergyModel() = default;

    /** @brief Movement plus communication energy of the cluster (or hub) with @p tour_id. */
    [[nodiscard]] virtual double total_energy(const PlanningState& state, int tour_id) const = 0;
    /** @brief Movement energy of the virtual (@p initial) or real configuration. */
    [[nodiscard]] virtual double total_sim_movement_energy(const PlanningState& state, bool initial) const = 0;
    /** @brief Communication energy of the virtual (@p initial) or real configuration. */
    [[nodiscard]] virtual double total_sim_comms_energy(const PlanningState& state, bool initial) const = 0;
};

/**
 * @brief Constants of the default movement/radio energy model.
 */
struct EnergyConfig final {
    double motion_cost_j_per_m{1.0};           /**< Energy an agent spends per metre travelled. */
    double segment_data_bits{1.0e9};           /**< Data each segment uploads per mission. */
    double electronics_j_per_bit{50.0e-9};     /**< Radio electronics energy per bit. */
    double amplifier_j_per_bit_m2{100.0e-12};  /**< Free-space amplifier energy per bit per square metre. */
};

/** @brief Weight of the minimum spanning tree over @p points (Prim, O(n²)). */
[[nodiscard]] double spanning_tree_length_m(const std::vector<Point2>& points);

/**
 * @brief Default model: twice the spanning tree for movement, first-order radio for uploads.
 *
 * A tour's movement cost covers its cells plus its attachment point on the
 * hub; the communication cost covers the segments bound to its cells. A hub
 * still parked on its placeholder costs nothing.
 */
class TourEnergyModel final : public EnergyModel {
  public:
    explicit TourEnergyModel(EnergyConfig config);

    [[nodiscard]] const EnergyConfig& config() const noexcept;

    [[nodiscard]] double movement_energy(const PlanningState& state, const Cluster& cluster) const;
    [[nodiscard]] double comms_energy(const PlanningState& state, const std::vector<CellId>& cells) const;

    [[nodiscard]] double total_energy(const PlanningState& state, int tour_id) const override;
    [[nodiscard]] double total_sim_movement_energy(const PlanningState& state, bool initial) const override;
    [[nodiscard]] double total_sim_comms_energy(const PlanningState& state, bool initial) const override;

  private:
    [[nodiscard]] double closed_tour_energy(const Grid& grid, const std::vector<CellId>& cells, const Point2* attachment) const;

    EnergyConfig config_;
};

}  // namespace flower
