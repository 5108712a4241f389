// === Energy Balancer =========================================================
//
// Hill-climbing passes that hand single cells between tours (or the hub) to
// shrink the standard deviation of per-tour energy. Every round is applied
// speculatively through a `MoveJournal` and rolled back verbatim when it does
// not strictly improve the balance, which also ends the pass.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>

#include "flower/energy_model.hpp"
#include "flower/planning_state.hpp"

namespace flower {

inline constexpr std::size_t k_default_max_balance_rounds{100};

/**
 * @brief Outcome of one balancing pass.
 */
struct BalanceReport final {
    std::size_t rounds{};     /**< Rounds whose moves were kept. */
    double initial_stdev_j{}; /**< Energy standard deviation before the first round. */
    double final_stdev_j{};   /**< Energy standard deviation after the last kept round. */
};

/**
 * @brief Records cell moves so a round can be undone exactly.
 *
 * Before each move the two touched clusters are snapshotted together with
 * every tour's anchor and the moved cell's stamp; rollback restores them in
 * reverse order, leaving membership order untouched.
 */
class MoveJournal final {
  public:
    explicit MoveJournal(PlanningState& state);

    /** @brief Move @p cell from @p source to @p destination and refresh anchors. */
    void apply(Cluster& source, Cluster& destination, CellId cell);
    /** @brief Undo every recorded move, newest first. */
    void rollback();
    /** @brief Keep the recorded moves and forget them. */
    void commit() noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

  private:
    struct Entry final {
        Cluster* source{};
        ClusterState source_state{};
        Cluster* destination{};
        ClusterState destination_state{};
        CellId cell{};
        int cell_tour_id{k_not_clustered};
        std::vector<std::optional<CellId>> list_anchors{};
    };

    PlanningState& state_;
    std::vector<Entry> list_entries_;
};

/** @brief Population standard deviation of @p values; zero for an empty list. */
[[nodiscard]] double standard_deviation(const std::vector<double>& values);

/** @brief Local search equalising energy across tours and the hub. */
class EnergyBalancer final {
  public:
    EnergyBalancer(
        const EnergyModel& energy_model,
        std::shared_ptr<spdlog::logger> logger,
        std::size_t max_rounds = k_default_max_balance_rounds
    );

    [[nodiscard]] std::size_t max_rounds() const noexcept;

    /** @brief Energy of every tour (id order) followed by the hub. */
    [[nodiscard]] std::vector<double> cluster_energies(const PlanningState& state) const;
    [[nodiscard]] double energy_stdev(const PlanningState& state) const;

    /**
     * @brief Shift cells from the most expensive cluster to its cheapest angular neighbour.
     *
     * @throws OptimizationDivergenceError after more than max_rounds() kept rounds.
     */
    BalanceReport balance_neighbors(PlanningState& state) const;

    /**
     * @brief Trade cells between the hub and the cheapest/most expensive tours.
     *
     * @throws OptimizationDivergenceError after more than max_rounds() kept rounds.
     */
    BalanceReport balance_hub(PlanningState& state) const;

  private:
    void check_round_bound(std::size_t rounds, const char* pass_name) const;

    const EnergyModel& energy_model_;
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t max_rounds_;
};

}  // namespace flower
