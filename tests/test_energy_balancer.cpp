#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "flower/cluster_growth.hpp"
#include "flower/energy_balancer.hpp"
#include "flower/errors.hpp"
#include "test_support.hpp"

using namespace flower;

namespace {

/** Everything a balancing round may touch. */
struct Fingerprint final {
    std::vector<std::vector<CellId>> cells{};
    std::vector<std::optional<CellId>> anchors{};
    std::vector<int> tour_ids{};
    bool hub_parked{};
    int hub_relocations{};

    bool operator==(const Fingerprint&) const = default;
};

Fingerprint fingerprint(const PlanningState& state) {
    Fingerprint print{};
    for (const Cluster* cluster : state.all_clusters()) {
        print.cells.push_back(cluster->cells());
        print.anchors.push_back(cluster->anchor());
    }
    for (const Cell& cell : state.grid.cells()) {
        print.tour_ids.push_back(cell.tour_id);
    }
    print.hub_parked = state.hub.at_placeholder();
    print.hub_relocations = state.hub.relocation_count();
    return print;
}

/** Paired field with three agents: two mapped tours of two cells and a parked hub. */
PlanningState mapped_pairs() {
    PlanningState state = test::prepared_state(test::paired_segments(), 3);
    const test::CellCountEnergyModel model{1.0, 1.0};
    const ClusterGrowthEngine growth{model, test::test_logger()};
    growth.map_virtual_clusters(state);
    return state;
}

/**
 * Ring field with four agents (three tours) and hand-made memberships of
 * @p sizes cover cells each; the last entry is the hub's share.
 */
PlanningState handmade_tours(const std::vector<std::size_t>& sizes) {
    PlanningState state = test::prepared_state(test::ring_segments(), 4);
    std::size_t next = 0;
    for (std::size_t index = 0; index + 1 < sizes.size(); ++index) {
        Cluster tour{static_cast<int>(index)};
        for (std::size_t count = 0; count < sizes[index]; ++count) {
            tour.add(state.grid, state.cover.at(next++));
        }
        state.clusters.push_back(std::move(tour));
    }
    for (std::size_t count = 0; count < sizes.back(); ++count) {
        state.hub.add(state.grid, state.cover.at(next++));
    }
    state.refresh_anchors();
    return state;
}

}  // namespace

TEST_CASE("standard_deviation is the population deviation") {
    REQUIRE(standard_deviation({}) == Approx(0.0));
    REQUIRE(standard_deviation({3.0}) == Approx(0.0));
    REQUIRE(standard_deviation({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) == Approx(2.0));
}

TEST_CASE("MoveJournal rollback restores the state exactly") {
    PlanningState state = mapped_pairs();
    const Fingerprint before = fingerprint(state);

    MoveJournal journal{state};
    journal.apply(state.clusters[0], state.hub, state.clusters[0].cells().front());
    journal.apply(state.clusters[1], state.hub, state.clusters[1].cells().front());
    REQUIRE(journal.size() == 2);
    REQUIRE_FALSE(state.hub.at_placeholder());
    REQUIRE(state.hub.cells().size() == 2);

    journal.rollback();

    REQUIRE(journal.size() == 0);
    REQUIRE(fingerprint(state) == before);
}

TEST_CASE("MoveJournal commit keeps the moves") {
    PlanningState state = mapped_pairs();
    const CellId moved = state.clusters[0].cells().front();

    MoveJournal journal{state};
    journal.apply(state.clusters[0], state.clusters[1], moved);
    journal.commit();

    REQUIRE(journal.size() == 0);
    REQUIRE(state.clusters[1].contains(moved));
    REQUIRE(state.grid.cell(moved).tour_id == state.clusters[1].id());
}

TEST_CASE("EnergyBalancer reports per-cluster energies in id order") {
    const PlanningState state = mapped_pairs();
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};

    REQUIRE(balancer.cluster_energies(state) == std::vector<double>{2.0, 2.0, 0.0});
    REQUIRE(balancer.max_rounds() == k_default_max_balance_rounds);
}

TEST_CASE("balance_neighbors leaves the state untouched when the first move does not help") {
    PlanningState state = mapped_pairs();
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};
    const Fingerprint before = fingerprint(state);

    const BalanceReport report = balancer.balance_neighbors(state);

    REQUIRE(report.rounds == 0);
    REQUIRE(report.final_stdev_j == Approx(report.initial_stdev_j));
    REQUIRE(fingerprint(state) == before);
}

TEST_CASE("balance_neighbors never raises the energy spread") {
    PlanningState state = test::prepared_state(test::ring_segments(), 5);
    const TourEnergyModel model{EnergyConfig{}};
    const ClusterGrowthEngine growth{model, test::test_logger()};
    growth.map_virtual_clusters(state);
    const EnergyBalancer balancer{model, test::test_logger()};

    const BalanceReport report = balancer.balance_neighbors(state);

    REQUIRE(report.final_stdev_j <= report.initial_stdev_j);
    REQUIRE(balancer.energy_stdev(state) == Approx(report.final_stdev_j));
    for (const CellId cell : state.cover) {
        REQUIRE(test::membership_count(state, cell) == 1);
    }
}

TEST_CASE("balance_hub feeds a parked hub from the busiest tour") {
    PlanningState state = mapped_pairs();
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};

    const BalanceReport report = balancer.balance_hub(state);

    REQUIRE(report.rounds == 1);
    REQUIRE(report.initial_stdev_j == Approx(0.942809).epsilon(1e-5));
    REQUIRE(report.final_stdev_j == Approx(0.471405).epsilon(1e-5));
    REQUIRE_FALSE(state.hub.at_placeholder());
    REQUIRE(state.hub.cells().size() == 1);
    REQUIRE(state.hub.relocation_count() == 1);
    REQUIRE(balancer.cluster_energies(state) == std::vector<double>{1.0, 2.0, 1.0});
    for (const CellId cell : state.cover) {
        REQUIRE(test::membership_count(state, cell) == 1);
    }
}

TEST_CASE("balance_hub rolls back both moves of a rejected two-move round") {
    PlanningState state = mapped_pairs();
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};
    MoveJournal journal{state};
    journal.apply(state.clusters[0], state.hub, state.clusters[0].cells().front());
    journal.commit();
    const Fingerprint before = fingerprint(state);

    // Energies {1, 2, 1}: the round empties the hub into tour 0 and refills it
    // from tour 1, which leaves the spread unchanged.
    const BalanceReport report = balancer.balance_hub(state);

    REQUIRE(report.rounds == 0);
    REQUIRE(fingerprint(state) == before);
    REQUIRE(state.hub.cells().size() == 1);
    REQUIRE(state.hub.relocation_count() == 1);
}

TEST_CASE("balance_hub moves cells through the hub between two tours") {
    PlanningState state = handmade_tours({3, 2, 1, 2});
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};
    REQUIRE(state.hub.id() == 3);
    REQUIRE(balancer.cluster_energies(state) == std::vector<double>{3.0, 2.0, 1.0, 2.0});

    const BalanceReport report = balancer.balance_hub(state);

    REQUIRE(report.rounds == 1);
    REQUIRE(report.final_stdev_j == Approx(0.0));
    REQUIRE(balancer.cluster_energies(state) == std::vector<double>{2.0, 2.0, 2.0, 2.0});
    REQUIRE(state.hub.relocation_count() == 1);
    REQUIRE_FALSE(state.hub.at_placeholder());
    for (const CellId cell : state.cover) {
        REQUIRE(test::membership_count(state, cell) == 1);
    }
}

TEST_CASE("balance_hub drains the hub when it is the costliest cluster") {
    PlanningState state = handmade_tours({1, 1, 2, 4});
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger()};

    const BalanceReport report = balancer.balance_hub(state);

    REQUIRE(report.rounds == 2);
    REQUIRE(report.initial_stdev_j == Approx(1.224745).epsilon(1e-5));
    REQUIRE(report.final_stdev_j == Approx(0.0));
    REQUIRE(balancer.cluster_energies(state) == std::vector<double>{2.0, 2.0, 2.0, 2.0});
    REQUIRE(state.hub.cells().size() == 2);
    REQUIRE(state.hub.relocation_count() == 1);
}

TEST_CASE("balance_hub never raises the energy spread after greedy growth") {
    PlanningState state = test::prepared_state(test::ring_segments(), 5);
    const TourEnergyModel model{EnergyConfig{}};
    const ClusterGrowthEngine growth{model, test::test_logger()};
    growth.greedy_expansion(state);
    const EnergyBalancer balancer{model, test::test_logger()};

    const BalanceReport report = balancer.balance_hub(state);

    REQUIRE(report.rounds <= balancer.max_rounds());
    REQUIRE(report.final_stdev_j <= report.initial_stdev_j);
    REQUIRE(balancer.energy_stdev(state) == Approx(report.final_stdev_j));
    for (const CellId cell : state.cover) {
        REQUIRE(test::membership_count(state, cell) == 1);
    }
}

TEST_CASE("EnergyBalancer fails when improvements outlast the round bound") {
    PlanningState state = mapped_pairs();
    const test::CellCountEnergyModel model{1.0, 1.0};
    const EnergyBalancer balancer{model, test::test_logger(), 0};

    REQUIRE_THROWS_AS(balancer.balance_hub(state), OptimizationDivergenceError);
}
