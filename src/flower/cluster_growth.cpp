#include "flower/cluster_growth.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "flower/proximity.hpp"

namespace flower {

ClusterGrowthEngine::ClusterGrowthEngine(const EnergyModel& energy_model, std::shared_ptr<spdlog::logger> logger)
    : energy_model_(energy_model),
      logger_(std::move(logger)) {}

void ClusterGrowthEngine::map_virtual_clusters(PlanningState& state) const {
    state.clusters.clear();
    state.clusters.reserve(state.virtual_clusters.size());
    for (const VirtualCluster& virtual_cluster : state.virtual_clusters) {
        Cluster cluster{virtual_cluster.id};
        for (const CellId cell : virtual_cluster.cells) {
            cluster.add(state.grid, cell);
        }
        state.clusters.push_back(std::move(cluster));
    }
    state.refresh_anchors();
    logger_->info(R"({{"component":"growth","mode":"virtual_mapping","tours":{}}})", state.clusters.size());
}

std::size_t ClusterGrowthEngine::greedy_expansion(PlanningState& state) const {
    state.clusters.clear();
    state.clusters.reserve(state.virtual_clusters.size());
    for (const VirtualCluster& virtual_cluster : state.virtual_clusters) {
        Cluster cluster{virtual_cluster.id};
        const auto nearest = closest_nodes(state.grid, virtual_cluster.cells, state.hub.cells());
        if (nearest.has_value()) {
            cluster.add(state.grid, nearest->first);
        } else {
            cluster.mark_completed();
        }
        state.clusters.push_back(std::move(cluster));
    }
    state.refresh_anchors();

    std::size_t round = 1;
    while (true) {
        std::vector<Cluster*> candidates;
        for (Cluster* cluster : state.all_clusters()) {
            if (!cluster->completed()) {
                candidates.push_back(cluster);
            }
        }
        if (candidates.empty()) {
            break;
        }
        ++round;

        Cluster* c_least = candidates.front();
        double least_energy_j = energy_model_.total_energy(state, c_least->id());
        for (Cluster* candidate : candidates) {
            const double energy_j = energy_model_.total_energy(state, candidate->id());
            if (energy_j < least_energy_j) {
                least_energy_j = energy_j;
                c_least = candidate;
            }
        }

        const std::vector<CellId> unassigned = state.unassigned_cells();
        if (unassigned.empty()) {
            c_least->mark_completed();
            logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"complete_exhausted"}})", round, c_least->id());
            continue;
        }

        if (c_least->is_hub()) {
            grow_hub(state, unassigned, round);
        } else {
            grow_tour(state, *c_least, round);
        }
        state.refresh_anchors();
    }

    logger_->info(
        R"({{"component":"growth","mode":"greedy_expansion","rounds":{},"hub_cells":{}}})",
        round,
        state.hub.at_placeholder() ? 0 : state.hub.cells().size()
    );
    return round;
}

void ClusterGrowthEngine::grow_hub(PlanningState& state, const std::vector<CellId>& unassigned, std::size_t round) const {
    Hub& hub = state.hub;
    CellId best_cell = unassigned.front();

    if (hub.at_placeholder()) {
        best_cell = *std::min_element(unassigned.begin(), unassigned.end(), [&state](CellId lhs, CellId rhs) {
            return state.grid.cell(lhs).proximity < state.grid.cell(rhs).proximity;
        });
        hub.add(state.grid, best_cell);
        logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"relocate_hub","cell":{}}})", round, hub.id(), best_cell);
        return;
    }

    const std::vector<CellId> list_origin = hub.recent().has_value()
        ? std::vector<CellId>{hub.recent().value()}
        : state.hub_attachment_cells();
    const auto nearest = closest_nodes(state.grid, unassigned, list_origin);
    if (nearest.has_value()) {
        best_cell = nearest->first;
    }
    hub.add(state.grid, best_cell);
    logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"grow_hub","cell":{}}})", round, hub.id(), best_cell);
}

GrowthOutcome ClusterGrowthEngine::grow_tour(PlanningState& state, Cluster& cluster, std::size_t round) const {
    const VirtualCluster* virtual_cluster = state.find_virtual_cluster(cluster.id());
    const std::optional<CellId> recent = cluster.recent();
    if (virtual_cluster == nullptr || !recent.has_value()) {
        cluster.mark_completed();
        logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"complete_no_frontier"}})", round, cluster.id());
        return GrowthOutcome::Exhausted;
    }

    std::vector<CellId> candidates;
    for (const CellId cell : virtual_cluster->cells) {
        if (state.grid.cell(cell).tour_id == k_not_clustered) {
            candidates.push_back(cell);
        }
    }

    std::optional<CellId> best_cell;
    if (!candidates.empty()) {
        const auto nearest = closest_nodes(state.grid, candidates, {recent.value()});
        if (nearest.has_value()) {
            best_cell = nearest->first;
        }
    } else {
        const AdjacentCell adjacent = search_adjacent_cells(state, cluster, recent.value());
        if (adjacent.collision) {
            cluster.mark_completed();
            logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"complete_collision"}})", round, cluster.id());
            return GrowthOutcome::Collision;
        }
        best_cell = adjacent.cell;
    }

    if (best_cell.has_value()) {
        cluster.add(state.grid, best_cell.value());
        logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"grow_tour","cell":{}}})", round, cluster.id(), best_cell.value());
        return GrowthOutcome::Grew;
    }

    cluster.mark_completed();
    logger_->debug(R"({{"component":"growth","round":{},"cluster":{},"action":"complete_no_candidate"}})", round, cluster.id());
    return GrowthOutcome::Exhausted;
}

ClusterGrowthEngine::AdjacentCell ClusterGrowthEngine::search_adjacent_cells(
    const PlanningState& state,
    const Cluster& cluster,
    CellId origin
) const {
    const Cell& origin_cell = state.grid.cell(origin);
    const int max_radius = std::max(state.grid.rows(), state.grid.cols());

    for (int radius = 1; radius <= max_radius; ++radius) {
        for (const CellId neighbor : state.grid.cell_neighbors(origin_cell.row, origin_cell.col, radius)) {
            const Cell& neighbor_cell = state.grid.cell(neighbor);
            if (neighbor_cell.virtual_tour_id == k_not_clustered) {
                continue;
            }
            if (std::abs(neighbor_cell.virtual_tour_id - cluster.id()) != 1) {
                continue;
            }
            if (neighbor_cell.tour_id != k_not_clustered) {
                return AdjacentCell{std::nullopt, true};
            }
            return AdjacentCell{neighbor, false};
        }
    }
    return AdjacentCell{};
}

}  // namespace flower
