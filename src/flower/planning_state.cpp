#include "flower/planning_state.hpp"

#include <utility>

#include "flower/proximity.hpp"

namespace flower {

PlanningState::PlanningState(Grid grid_in)
    : grid(std::move(grid_in)),
      hub(0, grid.center()) {
    virtual_hub.placeholder = grid.center();
    virtual_hub.location = grid.cell(virtual_hub.placeholder).location;
}

void PlanningState::install_cover(std::vector<CellId> cover_cells) {
    cover = std::move(cover_cells);
}

void PlanningState::install_virtual_clusters(std::vector<VirtualCluster> list_virtual_clusters) {
    virtual_clusters = std::move(list_virtual_clusters);
    clusters.clear();
    hub = Hub(static_cast<int>(virtual_clusters.size()), virtual_hub.placeholder);
}

std::vector<Cluster*> PlanningState::all_clusters() {
    std::vector<Cluster*> list_all;
    list_all.reserve(clusters.size() + 1);
    for (Cluster& cluster : clusters) {
        list_all.push_back(&cluster);
    }
    list_all.push_back(&hub);
    return list_all;
}

std::vector<const Cluster*> PlanningState::all_clusters() const {
    std::vector<const Cluster*> list_all;
    list_all.reserve(clusters.size() + 1);
    for (const Cluster& cluster : clusters) {
        list_all.push_back(&cluster);
    }
    list_all.push_back(&hub);
    return list_all;
}

Cluster* PlanningState::find_cluster(int id) {
    if (id == hub.id()) {
        return &hub;
    }
    for (Cluster& cluster : clusters) {
        if (cluster.id() == id) {
            return &cluster;
        }
    }
    return nullptr;
}

const Cluster* PlanningState::find_cluster(int id) const {
    if (id == hub.id()) {
        return &hub;
    }
    for (const Cluster& cluster : clusters) {
        if (cluster.id() == id) {
            return &cluster;
        }
    }
    return nullptr;
}

const VirtualCluster* PlanningState::find_virtual_cluster(int id) const {
    for (const VirtualCluster& virtual_cluster : virtual_clusters) {
        if (virtual_cluster.id == id) {
            return &virtual_cluster;
        }
    }
    return nullptr;
}

std::vector<CellId> PlanningState::unassigned_cells() const {
    std::vector<CellId> list_unassigned;
    for (const CellId cell : cover) {
        if (grid.cell(cell).tour_id == k_not_clustered) {
            list_unassigned.push_back(cell);
        }
    }
    return list_unassigned;
}

std::vector<CellId> PlanningState::hub_attachment_cells() const {
    if (hub.cells().empty()) {
        return {hub.placeholder()};
    }
    return hub.cells();
}

CellId PlanningState::attachment_cell(const Cluster& cluster) const {
    if (const auto anchor = cluster.anchor(); anchor.has_value()) {
        return anchor.value();
    }
    return hub_attachment_cells().front();
}

void PlanningState::refresh_anchors() {
    const std::vector<CellId> list_hub_cells = hub_attachment_cells();
    for (Cluster& cluster : clusters) {
        const auto nearest = closest_nodes(grid, list_hub_cells, cluster.cells());
        cluster.set_anchor(nearest.has_value() ? nearest->first : list_hub_cells.front());
    }
}

}  // namespace flower
