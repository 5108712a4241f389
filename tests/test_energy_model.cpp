#include <stdexcept>

#include <catch2/catch.hpp>

#include "flower/cluster_growth.hpp"
#include "flower/energy_model.hpp"
#include "test_support.hpp"

using namespace flower;

namespace {

EnergyConfig movement_only() {
    EnergyConfig config{};
    config.segment_data_bits = 0.0;
    return config;
}

EnergyConfig comms_only() {
    EnergyConfig config{};
    config.motion_cost_j_per_m = 0.0;
    return config;
}

double expected_upload_j(const EnergyConfig& config, const Grid& grid, const Segment& segment) {
    const double range_m = distance_m(segment.location, grid.cell(segment.cover_cell.value()).location);
    return config.segment_data_bits * (config.electronics_j_per_bit + config.amplifier_j_per_bit_m2 * range_m * range_m);
}

}  // namespace

TEST_CASE("spanning_tree_length_m sums the minimum spanning tree edges") {
    REQUIRE(spanning_tree_length_m({}) == Approx(0.0));
    REQUIRE(spanning_tree_length_m({Point2{4.0, 4.0}}) == Approx(0.0));
    REQUIRE(spanning_tree_length_m({Point2{0.0, 0.0}, Point2{3.0, 0.0}, Point2{3.0, 4.0}}) == Approx(7.0));
    REQUIRE(spanning_tree_length_m({Point2{0.0, 0.0}, Point2{10.0, 0.0}, Point2{1.0, 0.0}, Point2{2.0, 0.0}}) == Approx(10.0));
}

TEST_CASE("TourEnergyModel charges a round trip from the hub for each tour") {
    PlanningState state = test::prepared_state(test::four_corner_segments(), 3);
    const TourEnergyModel model{movement_only()};

    Cluster& tour = state.clusters.emplace_back(0);
    tour.add(state.grid, state.cover.front());
    state.refresh_anchors();

    const double expected_j = 2.0 * distance_m(state.grid.cell(state.cover.front()).location, state.virtual_hub.location);
    REQUIRE(model.movement_energy(state, tour) == Approx(expected_j));
    REQUIRE(model.total_energy(state, 0) == Approx(expected_j));
}

TEST_CASE("TourEnergyModel costs nothing for a parked hub") {
    PlanningState state = test::prepared_state(test::four_corner_segments(), 3);
    const TourEnergyModel model{EnergyConfig{}};

    REQUIRE(state.hub.at_placeholder());
    REQUIRE(model.total_energy(state, state.hub.id()) == Approx(0.0));

    state.hub.add(state.grid, state.cover.front());
    REQUIRE(model.total_energy(state, state.hub.id()) > 0.0);
}

TEST_CASE("TourEnergyModel costs nothing for an emptied hub and routes tours via the centre") {
    PlanningState state = test::prepared_state(test::paired_segments(), 3);
    const TourEnergyModel model{movement_only()};
    Cluster& tour = state.clusters.emplace_back(0);
    tour.add(state.grid, state.cover.front());
    state.hub.add(state.grid, state.cover.back());
    state.hub.remove(state.grid, state.cover.back());
    state.refresh_anchors();

    REQUIRE_FALSE(state.hub.at_placeholder());
    REQUIRE(model.total_energy(state, state.hub.id()) == Approx(0.0));
    const double expected_j = 2.0 * distance_m(state.grid.cell(state.cover.front()).location, state.virtual_hub.location);
    REQUIRE(model.total_energy(state, 0) == Approx(expected_j));
}

TEST_CASE("TourEnergyModel charges uploads only to the cell a segment is bound to") {
    PlanningState state = test::prepared_state(test::four_corner_segments(), 3);
    const EnergyConfig config = comms_only();
    const TourEnergyModel model{config};

    const CellId cover_cell = state.cover.front();
    const Segment& segment = state.grid.segment(state.grid.cell(cover_cell).segments.front());
    REQUIRE(model.comms_energy(state, {cover_cell}) == Approx(expected_upload_j(config, state.grid, segment)));

    REQUIRE(model.comms_energy(state, {state.grid.center()}) == Approx(0.0));
}

TEST_CASE("TourEnergyModel initial totals follow the virtual clusters") {
    PlanningState state = test::prepared_state(test::ring_segments(), 5);

    const EnergyConfig comms_config = comms_only();
    const TourEnergyModel comms_model{comms_config};
    double expected_comms_j = 0.0;
    for (const Segment& segment : state.grid.segments()) {
        expected_comms_j += expected_upload_j(comms_config, state.grid, segment);
    }
    REQUIRE(comms_model.total_sim_comms_energy(state, true) == Approx(expected_comms_j));
    REQUIRE(comms_model.total_sim_movement_energy(state, true) == Approx(0.0));

    const TourEnergyModel movement_model{movement_only()};
    double expected_movement_j = 0.0;
    for (const VirtualCluster& virtual_cluster : state.virtual_clusters) {
        std::vector<Point2> points{state.virtual_hub.location};
        for (const CellId cell : virtual_cluster.cells) {
            points.push_back(state.grid.cell(cell).location);
        }
        expected_movement_j += 2.0 * spanning_tree_length_m(points);
    }
    REQUIRE(movement_model.total_sim_movement_energy(state, true) == Approx(expected_movement_j));
}

TEST_CASE("TourEnergyModel final totals match the per-tour energies") {
    PlanningState state = test::prepared_state(test::ring_segments(), 5);
    const TourEnergyModel model{EnergyConfig{}};
    const ClusterGrowthEngine growth{model, test::test_logger()};
    growth.map_virtual_clusters(state);

    double per_tour_j = 0.0;
    for (const Cluster* cluster : state.all_clusters()) {
        per_tour_j += model.total_energy(state, cluster->id());
    }
    const double totals_j = model.total_sim_movement_energy(state, false) + model.total_sim_comms_energy(state, false);
    REQUIRE(totals_j == Approx(per_tour_j));

    const double repeated_j = model.total_energy(state, 0);
    REQUIRE(model.total_energy(state, 0) == Approx(repeated_j));
}

TEST_CASE("TourEnergyModel rejects unknown tours and negative constants") {
    PlanningState state = test::prepared_state(test::four_corner_segments(), 3);
    const TourEnergyModel model{EnergyConfig{}};

    REQUIRE_THROWS_AS(model.total_energy(state, 42), std::out_of_range);

    EnergyConfig negative{};
    negative.motion_cost_j_per_m = -1.0;
    REQUIRE_THROWS_AS(TourEnergyModel(negative), std::invalid_argument);
}
