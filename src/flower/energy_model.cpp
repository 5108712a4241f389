#include "flower/energy_model.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace flower {

double spanning_tree_length_m(const std::vector<Point2>& points) {
    if (points.size() < 2) {
        return 0.0;
    }

    std::vector<bool> in_tree(points.size(), false);
    std::vector<double> best_edge_m(points.size(), std::numeric_limits<double>::infinity());
    best_edge_m[0] = 0.0;
    double total_m = 0.0;

    for (std::size_t step = 0; step < points.size(); ++step) {
        std::size_t next = points.size();
        for (std::size_t index = 0; index < points.size(); ++index) {
            if (!in_tree[index] && (next == points.size() || best_edge_m[index] < best_edge_m[next])) {
                next = index;
            }
        }
        in_tree[next] = true;
        total_m += best_edge_m[next];
        for (std::size_t index = 0; index < points.size(); ++index) {
            if (!in_tree[index]) {
                best_edge_m[index] = std::min(best_edge_m[index], distance_m(points[next], points[index]));
            }
        }
    }
    return total_m;
}

TourEnergyModel::TourEnergyModel(EnergyConfig config)
    : config_(config) {
    if (config_.motion_cost_j_per_m < 0.0 || config_.segment_data_bits < 0.0
        || config_.electronics_j_per_bit < 0.0 || config_.amplifier_j_per_bit_m2 < 0.0) {
        throw std::invalid_argument("Energy model constants must not be negative");
    }
}

const EnergyConfig& TourEnergyModel::config() const noexcept {
    return config_;
}

double TourEnergyModel::closed_tour_energy(const Grid& grid, const std::vector<CellId>& cells, const Point2* attachment) const {
    if (cells.empty()) {
        return 0.0;
    }
    std::vector<Point2> points;
    points.reserve(cells.size() + 1);
    for (const CellId cell : cells) {
        points.push_back(grid.cell(cell).location);
    }
    if (attachment != nullptr) {
        points.push_back(*attachment);
    }
    return config_.motion_cost_j_per_m * 2.0 * spanning_tree_length_m(points);
}

double TourEnergyModel::movement_energy(const PlanningState& state, const Cluster& cluster) const {
    if (cluster.is_hub()) {
        if (state.hub.at_placeholder()) {
            return 0.0;
        }
        return closed_tour_energy(state.grid, cluster.cells(), nullptr);
    }
    const Point2 attachment = state.grid.cell(state.attachment_cell(cluster)).location;
    return closed_tour_energy(state.grid, cluster.cells(), &attachment);
}

double TourEnergyModel::comms_energy(const PlanningState& state, const std::vector<CellId>& cells) const {
    double total_j = 0.0;
    for (const CellId cell : cells) {
        const Cell& collection_cell = state.grid.cell(cell);
        for (const SegmentId segment_id : collection_cell.segments) {
            const Segment& segment = state.grid.segment(segment_id);
            if (segment.cover_cell != cell) {
                continue;
            }
            const double range_m = distance_m(segment.location, collection_cell.location);
            total_j += config_.segment_data_bits
                * (config_.electronics_j_per_bit + config_.amplifier_j_per_bit_m2 * range_m * range_m);
        }
    }
    return total_j;
}

double TourEnergyModel::total_energy(const PlanningState& state, int tour_id) const {
    const Cluster* cluster = state.find_cluster(tour_id);
    if (cluster == nullptr) {
        throw std::out_of_range("No cluster with tour id " + std::to_string(tour_id));
    }
    if (cluster->is_hub() && state.hub.at_placeholder()) {
        return 0.0;
    }
    return movement_energy(state, *cluster) + comms_energy(state, cluster->cells());
}

double TourEnergyModel::total_sim_movement_energy(const PlanningState& state, bool initial) const {
    double total_j = 0.0;
    if (initial) {
        for (const VirtualCluster& virtual_cluster : state.virtual_clusters) {
            total_j += closed_tour_energy(state.grid, virtual_cluster.cells, &state.virtual_hub.location);
        }
        return total_j;
    }
    for (const Cluster* cluster : state.all_clusters()) {
        total_j += movement_energy(state, *cluster);
    }
    return total_j;
}

double TourEnergyModel::total_sim_comms_energy(const PlanningState& state, bool initial) const {
    double total_j = 0.0;
    if (initial) {
        for (const VirtualCluster& virtual_cluster : state.virtual_clusters) {
            total_j += comms_energy(state, virtual_cluster.cells);
        }
        return total_j;
    }
    for (const Cluster* cluster : state.all_clusters()) {
        if (cluster->is_hub() && state.hub.at_placeholder()) {
            continue;
        }
        total_j += comms_energy(state, cluster->cells());
    }
    return total_j;
}

}  // namespace flower
