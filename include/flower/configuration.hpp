// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects for the planner, the random
// sensor field and logging. `ConfigurationLoader` translates environment
// variables into these structures so downstream modules never touch
// `std::getenv` directly.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/logger.h>

#include "flower/tour_planner.hpp"

namespace flower {

/**
 * @brief Parameters of the randomly generated sensor field.
 */
struct FieldConfig final {
    std::size_t segment_count{};  /**< Number of segments to scatter over the area. */
    std::uint32_t seed{};         /**< Seed for the field generator. */
};

/**
 * @brief Immutable bundle of runtime knobs for a planning session.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};  /**< Destination directory for structured logs. */
    std::string log_level{};      /**< Requested spdlog level name; empty keeps the default. */
    PlannerConfig planner{};      /**< Grid, fleet, energy and balancer settings. */
    FieldConfig field{};          /**< Random field settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize logging and read every setting, falling back to defaults. */
    static Configuration load();

  private:
    static PlannerConfig load_planner(const std::shared_ptr<spdlog::logger>& logger);
    static FieldConfig load_field(const std::shared_ptr<spdlog::logger>& logger);
};

}  // namespace flower
