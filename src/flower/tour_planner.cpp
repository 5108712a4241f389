#include "flower/tour_planner.hpp"

#include <stdexcept>
#include <utility>

#include "flower/cluster_growth.hpp"
#include "flower/coverage_selector.hpp"
#include "flower/virtual_cluster_builder.hpp"

namespace flower {

TourPlanner::TourPlanner(PlannerConfig config, std::shared_ptr<const EnergyModel> energy_model, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      energy_model_(std::move(energy_model)),
      logger_(std::move(logger)) {
    if (config_.agent_count < 2) {
        throw std::invalid_argument("TourPlanner requires at least two relay agents");
    }
    if (energy_model_ == nullptr) {
        throw std::invalid_argument("TourPlanner requires an energy model");
    }
    if (logger_ == nullptr) {
        throw std::invalid_argument("TourPlanner requires a logger");
    }
}

const PlannerConfig& TourPlanner::config() const noexcept {
    return config_;
}

PlanResult TourPlanner::plan(const std::vector<Point2>& segment_locations) const {
    PlanningState state{Grid{config_.grid, segment_locations}};
    logger_->info(
        R"({{"component":"planner","segments":{},"agents":{},"rows":{},"cols":{},"cell_size_m":{}}})",
        segment_locations.size(),
        config_.agent_count,
        state.grid.rows(),
        state.grid.cols(),
        state.grid.cell_size_m()
    );

    const CoverageSelector coverage_selector{logger_};
    state.install_cover(coverage_selector.select(state.grid, config_.agent_count));

    const VirtualClusterBuilder virtual_cluster_builder{logger_};
    state.install_virtual_clusters(virtual_cluster_builder.build(state.grid, state.cover, config_.agent_count));

    const double initial_movement_j = energy_model_->total_sim_movement_energy(state, true);
    const double initial_comms_j = energy_model_->total_sim_comms_energy(state, true);

    const BranchSelector branch_selector{logger_, config_.dominance_ratio};
    const PlanningBranch branch = branch_selector.select(initial_movement_j, initial_comms_j);

    const ClusterGrowthEngine growth_engine{*energy_model_, logger_};
    const EnergyBalancer balancer{*energy_model_, logger_, config_.max_balance_rounds};

    std::size_t growth_rounds = 0;
    std::optional<BalanceReport> balance;
    switch (branch) {
        case PlanningBranch::MovementDominant:
            growth_engine.map_virtual_clusters(state);
            break;
        case PlanningBranch::CommunicationDominant:
            growth_engine.map_virtual_clusters(state);
            balance = balancer.balance_neighbors(state);
            break;
        case PlanningBranch::Balanced:
            growth_rounds = growth_engine.greedy_expansion(state);
            balance = balancer.balance_hub(state);
            break;
    }

    const double final_movement_j = energy_model_->total_sim_movement_energy(state, false);
    const double final_comms_j = energy_model_->total_sim_comms_energy(state, false);

    PlanResult result{std::move(state)};
    result.branch = branch;
    result.initial_movement_j = initial_movement_j;
    result.initial_comms_j = initial_comms_j;
    result.final_movement_j = final_movement_j;
    result.final_comms_j = final_comms_j;
    result.growth_rounds = growth_rounds;
    result.balance = balance;
    result.movement_sharing_needed = much_greater_than(final_movement_j, final_comms_j, config_.dominance_ratio);
    result.comms_sharing_needed = much_greater_than(final_comms_j, final_movement_j, config_.dominance_ratio);

    log_summary(result);
    return result;
}

void TourPlanner::log_summary(const PlanResult& result) const {
    if (result.movement_sharing_needed) {
        logger_->warn(R"({"component":"planner","diagnosis":"tour_sharing_needed","dominant":"movement"})");
    } else if (result.comms_sharing_needed) {
        logger_->warn(R"({"component":"planner","diagnosis":"tour_sharing_needed","dominant":"comms"})");
    }
    logger_->info(
        R"({{"component":"planner","branch":"{}","tours":{},"final_movement_j":{},"final_comms_j":{},"balance_rounds":{}}})",
        to_string(result.branch),
        result.state.clusters.size(),
        result.final_movement_j,
        result.final_comms_j,
        result.balance.has_value() ? result.balance->rounds : 0
    );
}

}  // namespace flower
