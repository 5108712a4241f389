#include "flower/branch_selector.hpp"

#include <stdexcept>

namespace flower {

bool much_greater_than(double lhs, double rhs, double ratio) noexcept {
    if (lhs <= 0.0) {
        return false;
    }
    return rhs / lhs < ratio;
}

BranchSelector::BranchSelector(std::shared_ptr<spdlog::logger> logger, double dominance_ratio)
    : logger_(std::move(logger)),
      dominance_ratio_(dominance_ratio) {
    if (dominance_ratio_ <= 0.0 || dominance_ratio_ >= 1.0) {
        throw std::invalid_argument("Dominance ratio must lie strictly between 0 and 1");
    }
}

double BranchSelector::dominance_ratio() const noexcept {
    return dominance_ratio_;
}

PlanningBranch BranchSelector::select(double movement_energy_j, double comms_energy_j) const {
    PlanningBranch branch = PlanningBranch::Balanced;
    if (much_greater_than(movement_energy_j, comms_energy_j, dominance_ratio_)) {
        branch = PlanningBranch::MovementDominant;
    } else if (much_greater_than(comms_energy_j, movement_energy_j, dominance_ratio_)) {
        branch = PlanningBranch::CommunicationDominant;
    }
    logger_->info(
        R"({{"component":"branch","movement_j":{},"comms_j":{},"branch":"{}"}})",
        movement_energy_j,
        comms_energy_j,
        to_string(branch)
    );
    return branch;
}

}  // namespace flower
