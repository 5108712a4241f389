// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the planner. Raw environment variables are turned into the strongly-typed
// `Configuration` structure; anything unparseable or out of range falls back
// to its default with a logged warning.
//
// Callers are expected to populate the process environment ahead of time
// (shell exports or a sourced `.env`); nothing is read from disk here.

#include "flower/configuration.hpp"

#include <chrono>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "flower/logging.hpp"

namespace flower {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::size_t k_default_segment_count{30};
constexpr int k_default_agent_count{4};
constexpr double k_default_area_m{1200.0};
constexpr double k_default_comms_range_m{100.0};

double parse_double(const std::shared_ptr<spdlog::logger>& logger, const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            logger->warn(R"({{"component":"config","variable":"{}","error":"not_positive","fallback":{}}})", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        logger->warn(R"({{"component":"config","variable":"{}","error":"not_a_number","fallback":{}}})", name, fallback);
        return fallback;
    }
}

long long parse_integer(
    const std::shared_ptr<spdlog::logger>& logger,
    const char* name,
    long long fallback,
    long long minimum,
    long long maximum = std::numeric_limits<long long>::max()
) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const long long parsed_value = std::stoll(raw_value);
        if (parsed_value < minimum || parsed_value > maximum) {
            logger->warn(
                R"({{"component":"config","variable":"{}","error":"out_of_range","minimum":{},"maximum":{},"fallback":{}}})",
                name,
                minimum,
                maximum,
                fallback
            );
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        logger->warn(R"({{"component":"config","variable":"{}","error":"not_an_integer","fallback":{}}})", name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

std::uint32_t time_seed() {
    const auto ticks = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(ticks).count());
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("FLOWER_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string("FLOWER_LOG_LEVEL", "");

    auto logger = initialize_logger(config.log_directory);
    logger->info(R"({"component":"config","event":"load"})");

    config.planner = load_planner(logger);
    config.field = load_field(logger);

    logger->info(
        R"({{"component":"config","segments":{},"agents":{},"width_m":{},"height_m":{},"comms_range_m":{},"seed":{}}})",
        config.field.segment_count,
        config.planner.agent_count,
        config.planner.grid.width_m,
        config.planner.grid.height_m,
        config.planner.grid.comms_range_m,
        config.field.seed
    );
    return config;
}

PlannerConfig ConfigurationLoader::load_planner(const std::shared_ptr<spdlog::logger>& logger) {
    PlannerConfig planner{};
    planner.grid.width_m = parse_double(logger, "FLOWER_AREA_WIDTH_M", k_default_area_m);
    planner.grid.height_m = parse_double(logger, "FLOWER_AREA_HEIGHT_M", k_default_area_m);
    planner.grid.comms_range_m = parse_double(logger, "FLOWER_COMMS_RANGE_M", k_default_comms_range_m);
    planner.agent_count = static_cast<int>(parse_integer(logger, "FLOWER_AGENT_COUNT", k_default_agent_count, 2));
    planner.max_balance_rounds = static_cast<std::size_t>(
        parse_integer(logger, "FLOWER_MAX_BALANCE_ROUNDS", static_cast<long long>(k_default_max_balance_rounds), 0)
    );
    planner.energy.motion_cost_j_per_m = parse_double(logger, "FLOWER_MOTION_COST_J_PER_M", planner.energy.motion_cost_j_per_m);
    planner.energy.segment_data_bits = parse_double(logger, "FLOWER_SEGMENT_DATA_BITS", planner.energy.segment_data_bits);
    return planner;
}

FieldConfig ConfigurationLoader::load_field(const std::shared_ptr<spdlog::logger>& logger) {
    FieldConfig field{};
    field.segment_count = static_cast<std::size_t>(
        parse_integer(logger, "FLOWER_SEGMENT_COUNT", static_cast<long long>(k_default_segment_count), 1)
    );
    field.seed = static_cast<std::uint32_t>(parse_integer(
        logger,
        "FLOWER_SEED",
        time_seed(),
        0,
        static_cast<long long>(std::numeric_limits<std::uint32_t>::max())
    ));
    return field;
}

}  // namespace flower
