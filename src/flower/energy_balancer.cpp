#include "flower/energy_balancer.hpp"

#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include "flower/errors.hpp"
#include "flower/proximity.hpp"

namespace flower {

namespace {

std::size_t index_of_min(const std::vector<double>& values) {
    std::size_t best = 0;
    for (std::size_t index = 1; index < values.size(); ++index) {
        if (values[index] < values[best]) {
            best = index;
        }
    }
    return best;
}

std::size_t index_of_max(const std::vector<double>& values) {
    std::size_t best = 0;
    for (std::size_t index = 1; index < values.size(); ++index) {
        if (values[index] > values[best]) {
            best = index;
        }
    }
    return best;
}

/**
 * @brief Location of the hub cell a tour attaches to.
 */
Point2 anchor_location(const PlanningState& state, const Cluster& cluster) {
    return state.grid.cell(state.attachment_cell(cluster)).location;
}

}  // namespace

MoveJournal::MoveJournal(PlanningState& state)
    : state_(state) {}

void MoveJournal::apply(Cluster& source, Cluster& destination, CellId cell) {
    Entry entry{};
    entry.source = &source;
    entry.source_state = source.snapshot();
    entry.destination = &destination;
    entry.destination_state = destination.snapshot();
    entry.cell = cell;
    entry.cell_tour_id = state_.grid.cell(cell).tour_id;
    entry.list_anchors.reserve(state_.clusters.size());
    for (const Cluster& cluster : state_.clusters) {
        entry.list_anchors.push_back(cluster.anchor());
    }
    list_entries_.push_back(std::move(entry));

    source.remove(state_.grid, cell);
    destination.add(state_.grid, cell);
    state_.refresh_anchors();
}

void MoveJournal::rollback() {
    for (auto iterator_entry = list_entries_.rbegin(); iterator_entry != list_entries_.rend(); ++iterator_entry) {
        iterator_entry->source->restore(iterator_entry->source_state);
        iterator_entry->destination->restore(iterator_entry->destination_state);
        state_.grid.cell(iterator_entry->cell).tour_id = iterator_entry->cell_tour_id;
        for (std::size_t index = 0; index < state_.clusters.size(); ++index) {
            state_.clusters[index].set_anchor(iterator_entry->list_anchors[index]);
        }
    }
    list_entries_.clear();
}

void MoveJournal::commit() noexcept {
    list_entries_.clear();
}

std::size_t MoveJournal::size() const noexcept {
    return list_entries_.size();
}

double standard_deviation(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const double value : values) {
        sum += value;
    }
    const double mean = sum / static_cast<double>(values.size());
    double squared_deviation = 0.0;
    for (const double value : values) {
        squared_deviation += (value - mean) * (value - mean);
    }
    return std::sqrt(squared_deviation / static_cast<double>(values.size()));
}

EnergyBalancer::EnergyBalancer(const EnergyModel& energy_model, std::shared_ptr<spdlog::logger> logger, std::size_t max_rounds)
    : energy_model_(energy_model),
      logger_(std::move(logger)),
      max_rounds_(max_rounds) {}

std::size_t EnergyBalancer::max_rounds() const noexcept {
    return max_rounds_;
}

std::vector<double> EnergyBalancer::cluster_energies(const PlanningState& state) const {
    std::vector<double> energies;
    for (const Cluster* cluster : state.all_clusters()) {
        energies.push_back(energy_model_.total_energy(state, cluster->id()));
    }
    return energies;
}

double EnergyBalancer::energy_stdev(const PlanningState& state) const {
    return standard_deviation(cluster_energies(state));
}

void EnergyBalancer::check_round_bound(std::size_t rounds, const char* pass_name) const {
    if (rounds > max_rounds_) {
        logger_->error(R"({{"component":"balancer","pass":"{}","rounds":{},"error":"diverged"}})", pass_name, rounds);
        throw OptimizationDivergenceError(fmt::format("{} balancing did not converge within {} rounds", pass_name, max_rounds_));
    }
}

BalanceReport EnergyBalancer::balance_neighbors(PlanningState& state) const {
    BalanceReport report{};
    report.initial_stdev_j = energy_stdev(state);
    report.final_stdev_j = report.initial_stdev_j;

    while (true) {
        check_round_bound(report.rounds, "neighbor");

        const std::vector<Cluster*> list_all = state.all_clusters();
        const std::vector<double> energies = cluster_energies(state);
        const double stdev_j = standard_deviation(energies);

        Cluster* c_most = list_all[index_of_max(energies)];

        Cluster* neighbor = nullptr;
        double neighbor_energy_j = 0.0;
        for (std::size_t index = 0; index < list_all.size(); ++index) {
            if (std::abs(list_all[index]->id() - c_most->id()) != 1) {
                continue;
            }
            if (neighbor == nullptr || energies[index] < neighbor_energy_j) {
                neighbor = list_all[index];
                neighbor_energy_j = energies[index];
            }
        }
        if (neighbor == nullptr) {
            break;
        }

        const std::vector<CellId> list_targets = neighbor->cells().empty()
            ? std::vector<CellId>{state.attachment_cell(*neighbor)}
            : neighbor->cells();
        const auto nearest = closest_nodes(state.grid, c_most->movable_cells(), list_targets);
        if (!nearest.has_value()) {
            break;
        }

        MoveJournal journal{state};
        journal.apply(*c_most, *neighbor, nearest->first);

        const double stdev_new_j = energy_stdev(state);
        if (stdev_new_j >= stdev_j) {
            journal.rollback();
            logger_->debug(
                R"({{"component":"balancer","pass":"neighbor","round":{},"action":"revert","stdev_j":{}}})",
                report.rounds + 1,
                stdev_new_j
            );
            break;
        }
        journal.commit();
        ++report.rounds;
        report.final_stdev_j = stdev_new_j;
        logger_->info(
            R"({{"component":"balancer","pass":"neighbor","round":{},"cell":{},"from":{},"to":{},"stdev_j":{}}})",
            report.rounds,
            nearest->first,
            c_most->id(),
            neighbor->id(),
            stdev_new_j
        );
    }

    return report;
}

BalanceReport EnergyBalancer::balance_hub(PlanningState& state) const {
    BalanceReport report{};
    report.initial_stdev_j = energy_stdev(state);
    report.final_stdev_j = report.initial_stdev_j;
    Hub& hub = state.hub;

    while (true) {
        check_round_bound(report.rounds, "hub");

        const std::vector<Cluster*> list_all = state.all_clusters();
        const std::vector<double> energies = cluster_energies(state);
        const double stdev_j = standard_deviation(energies);

        Cluster* c_least = list_all[index_of_min(energies)];
        Cluster* c_most = list_all[index_of_max(energies)];
        if (c_least == c_most) {
            break;
        }

        MoveJournal journal{state};
        if (c_least->is_hub()) {
            const auto cell_in = closest_node(state.grid, c_most->movable_cells(), anchor_location(state, *c_most));
            if (cell_in.has_value()) {
                journal.apply(*c_most, hub, cell_in.value());
            }
        } else if (c_most->is_hub()) {
            const auto cell_out = closest_node(state.grid, hub.movable_cells(), anchor_location(state, *c_least));
            if (cell_out.has_value()) {
                journal.apply(hub, *c_least, cell_out.value());
            }
        } else {
            const auto cell_out = closest_node(state.grid, hub.movable_cells(), anchor_location(state, *c_least));
            if (cell_out.has_value()) {
                journal.apply(hub, *c_least, cell_out.value());
            }
            const auto cell_in = closest_node(state.grid, c_most->movable_cells(), anchor_location(state, *c_most));
            if (cell_in.has_value()) {
                journal.apply(*c_most, hub, cell_in.value());
            }
        }

        if (journal.size() == 0) {
            break;
        }

        const double stdev_new_j = energy_stdev(state);
        if (stdev_new_j >= stdev_j) {
            journal.rollback();
            logger_->debug(
                R"({{"component":"balancer","pass":"hub","round":{},"action":"revert","stdev_j":{}}})",
                report.rounds + 1,
                stdev_new_j
            );
            break;
        }
        const std::size_t moves = journal.size();
        journal.commit();
        ++report.rounds;
        report.final_stdev_j = stdev_new_j;
        logger_->info(
            R"({{"component":"balancer","pass":"hub","round":{},"moves":{},"least":{},"most":{},"stdev_j":{}}})",
            report.rounds,
            moves,
            c_least->id(),
            c_most->id(),
            stdev_new_j
        );
    }

    return report;
}

}  // namespace flower
