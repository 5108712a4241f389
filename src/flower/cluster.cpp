#include "flower/cluster.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace flower {

Cluster::Cluster(int id)
    : id_(id) {}

int Cluster::id() const noexcept {
    return id_;
}

const std::vector<CellId>& Cluster::cells() const noexcept {
    return list_cells_;
}

bool Cluster::contains(CellId cell) const {
    return std::find(list_cells_.begin(), list_cells_.end(), cell) != list_cells_.end();
}

std::vector<CellId> Cluster::movable_cells() const {
    return list_cells_;
}

bool Cluster::is_hub() const noexcept {
    return false;
}

std::optional<CellId> Cluster::recent() const noexcept {
    return recent_;
}

void Cluster::set_recent(std::optional<CellId> cell) noexcept {
    recent_ = cell;
}

std::optional<CellId> Cluster::anchor() const noexcept {
    return anchor_;
}

void Cluster::set_anchor(std::optional<CellId> cell) noexcept {
    anchor_ = cell;
}

bool Cluster::completed() const noexcept {
    return flag_completed_;
}

void Cluster::mark_completed() noexcept {
    flag_completed_ = true;
}

void Cluster::add(Grid& grid, CellId cell) {
    Cell& target = grid.cell(cell);
    if (target.tour_id != k_not_clustered) {
        throw std::logic_error(
            "Cell " + std::to_string(cell) + " already belongs to cluster " + std::to_string(target.tour_id)
        );
    }
    list_cells_.push_back(cell);
    target.tour_id = id_;
    recent_ = cell;
}

void Cluster::remove(Grid& grid, CellId cell) {
    const auto iterator_cell = std::find(list_cells_.begin(), list_cells_.end(), cell);
    if (iterator_cell == list_cells_.end()) {
        throw std::logic_error("Cell " + std::to_string(cell) + " is not a member of cluster " + std::to_string(id_));
    }
    list_cells_.erase(iterator_cell);
    grid.cell(cell).tour_id = k_not_clustered;

    if (recent_ == cell) {
        recent_ = list_cells_.empty() ? std::nullopt : std::optional<CellId>{list_cells_.back()};
    }
}

ClusterState Cluster::snapshot() const {
    return ClusterState{list_cells_, recent_, anchor_, flag_completed_, false, 0};
}

void Cluster::restore(const ClusterState& state) {
    list_cells_ = state.cells;
    recent_ = state.recent;
    anchor_ = state.anchor;
    flag_completed_ = state.completed;
}

Hub::Hub(int id, CellId placeholder)
    : Cluster(id),
      placeholder_(placeholder) {
    list_cells_.push_back(placeholder_);
}

CellId Hub::placeholder() const noexcept {
    return placeholder_;
}

bool Hub::at_placeholder() const noexcept {
    return flag_at_placeholder_;
}

int Hub::relocation_count() const noexcept {
    return relocation_count_;
}

std::vector<CellId> Hub::movable_cells() const {
    if (flag_at_placeholder_) {
        return {};
    }
    return list_cells_;
}

bool Hub::is_hub() const noexcept {
    return true;
}

void Hub::add(Grid& grid, CellId cell) {
    if (flag_at_placeholder_) {
        // The placeholder was never stamped, so dropping it touches no cell.
        list_cells_.clear();
        recent_.reset();
        flag_at_placeholder_ = false;
        ++relocation_count_;
    }
    Cluster::add(grid, cell);
}

void Hub::remove(Grid& grid, CellId cell) {
    if (flag_at_placeholder_) {
        throw std::logic_error("Hub holds only its placeholder; nothing to remove");
    }
    // An emptied hub stays relocated; the placeholder is never restored.
    Cluster::remove(grid, cell);
}

ClusterState Hub::snapshot() const {
    ClusterState state = Cluster::snapshot();
    state.at_placeholder = flag_at_placeholder_;
    state.relocation_count = relocation_count_;
    return state;
}

void Hub::restore(const ClusterState& state) {
    Cluster::restore(state);
    flag_at_placeholder_ = state.at_placeholder;
    relocation_count_ = state.relocation_count;
}

}  // namespace flower
