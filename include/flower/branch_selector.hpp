// === Branch Selector =========================================================
//
// Chooses the planning strategy from the balance between the whole-field
// movement and communication energies.

#pragma once

#include <memory>

#include <spdlog/logger.h>

#include "flower/types.hpp"

namespace flower {

inline constexpr double k_default_dominance_ratio{0.2};

/**
 * @brief True when @p rhs is below @p ratio times @p lhs.
 *
 * A non-positive @p lhs never dominates.
 */
[[nodiscard]] bool much_greater_than(double lhs, double rhs, double ratio = k_default_dominance_ratio) noexcept;

/** @brief Maps the movement/communication energy balance to a planning branch. */
class BranchSelector final {
  public:
    explicit BranchSelector(std::shared_ptr<spdlog::logger> logger, double dominance_ratio = k_default_dominance_ratio);

    [[nodiscard]] double dominance_ratio() const noexcept;
    [[nodiscard]] PlanningBranch select(double movement_energy_j, double comms_energy_j) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
    double dominance_ratio_;
};

}  // namespace flower
