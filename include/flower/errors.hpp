// === Planning Errors =========================================================
//
// Exception hierarchy for fatal planning failures. Every error aborts the whole
// planning run; callers catch `PlanningError` (or `std::exception`) at the top.

#pragma once

#include <stdexcept>
#include <string>

namespace flower {

/** @brief Base class for every fatal planning failure. */
class PlanningError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief The greedy cover has too few relay points to serve the fleet. */
class InsufficientCoverError final : public PlanningError {
  public:
    using PlanningError::PlanningError;
};

/** @brief A segment cannot be reached by any eligible cell. */
class UncoverableSegmentError final : public PlanningError {
  public:
    using PlanningError::PlanningError;
};

/** @brief A balancing pass exceeded its round bound without converging. */
class OptimizationDivergenceError final : public PlanningError {
  public:
    using PlanningError::PlanningError;
};

}  // namespace flower
