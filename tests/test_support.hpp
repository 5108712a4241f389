#pragma once

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

#include "flower/coverage_selector.hpp"
#include "flower/energy_model.hpp"
#include "flower/planning_state.hpp"
#include "flower/virtual_cluster_builder.hpp"
#include "logging_test_fixture.hpp"

namespace flower::test {

/**
 * @brief Energy equal to the number of real cells in a tour.
 *
 * Whole-field energies are fixed so tests can steer the branch decision.
 */
class CellCountEnergyModel final : public EnergyModel {
  public:
    CellCountEnergyModel(double movement_j, double comms_j)
        : movement_j_(movement_j),
          comms_j_(comms_j) {}

    double total_energy(const PlanningState& state, int tour_id) const override {
        const Cluster* cluster = state.find_cluster(tour_id);
        if (cluster == nullptr || (cluster->is_hub() && state.hub.at_placeholder())) {
            return 0.0;
        }
        return static_cast<double>(cluster->cells().size());
    }

    double total_sim_movement_energy(const PlanningState&, bool) const override {
        return movement_j_;
    }

    double total_sim_comms_energy(const PlanningState&, bool) const override {
        return comms_j_;
    }

  private:
    double movement_j_;
    double comms_j_;
};

/** @brief 1 km square area with a 100 m radio range (15 x 15 cells). */
inline GridConfig square_km_grid() {
    return GridConfig{1000.0, 1000.0, 100.0};
}

/** @brief One segment near each corner; no cell reaches two of them. */
inline std::vector<Point2> four_corner_segments() {
    return {Point2{100.0, 100.0}, Point2{900.0, 100.0}, Point2{900.0, 900.0}, Point2{100.0, 900.0}};
}

/**
 * @brief Two pairs of segments 250 m apart on opposite sides of the area.
 *
 * No cell reaches two segments, so the cover has four cells, and the pairs
 * are far enough apart that three agents always get two virtual clusters of
 * two cells each.
 */
inline std::vector<Point2> paired_segments() {
    return {Point2{150.0, 150.0}, Point2{150.0, 400.0}, Point2{850.0, 150.0}, Point2{850.0, 400.0}};
}

/** @brief Eight segments evenly spaced on a 350 m circle around the area centre. */
inline std::vector<Point2> ring_segments() {
    return {
        Point2{850.0, 500.0},
        Point2{747.5, 747.5},
        Point2{500.0, 850.0},
        Point2{252.5, 747.5},
        Point2{150.0, 500.0},
        Point2{252.5, 252.5},
        Point2{500.0, 150.0},
        Point2{747.5, 252.5},
    };
}

/** @brief State with the cover selected and the virtual clusters installed. */
inline PlanningState prepared_state(const std::vector<Point2>& locations, int agent_count) {
    PlanningState state{Grid{square_km_grid(), locations}};
    const CoverageSelector selector{test_logger()};
    state.install_cover(selector.select(state.grid, agent_count));
    const VirtualClusterBuilder builder{test_logger()};
    state.install_virtual_clusters(builder.build(state.grid, state.cover, agent_count));
    return state;
}

/** @brief Number of clusters (hub included, unless parked) holding @p cell. */
inline int membership_count(const PlanningState& state, CellId cell) {
    int count = 0;
    for (const Cluster* cluster : state.all_clusters()) {
        if (cluster->is_hub() && state.hub.at_placeholder()) {
            continue;
        }
        count += static_cast<int>(std::count(cluster->cells().begin(), cluster->cells().end(), cell));
    }
    return count;
}

/** @brief Logger writing bare messages into a string buffer. */
struct CapturedLog final {
    std::ostringstream stream{};
    std::shared_ptr<spdlog::logger> logger{};

    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        sink->set_pattern("%v");
        logger = std::make_shared<spdlog::logger>("flower_capture", sink);
        logger->set_level(spdlog::level::info);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    [[nodiscard]] std::string text() const {
        return stream.str();
    }
};

}  // namespace flower::test
