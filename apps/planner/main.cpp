#include <cstdlib>
#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "flower/configuration.hpp"
#include "flower/energy_model.hpp"
#include "flower/field_generator.hpp"
#include "flower/logging.hpp"
#include "flower/tour_planner.hpp"
#include "flower/version.hpp"

int main() {
    using namespace flower;

    try {
        const Configuration configuration = ConfigurationLoader::load();
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }

        auto logger = get_logger();
        logger->info(R"({{"component":"app","event":"start","version":"{}","seed":{}}})", k_version, configuration.field.seed);

        const std::vector<Point2> segment_locations = generate_segment_field(
            configuration.field.segment_count,
            configuration.planner.grid.width_m,
            configuration.planner.grid.height_m,
            configuration.field.seed
        );

        auto energy_model = std::make_shared<const TourEnergyModel>(configuration.planner.energy);
        const TourPlanner planner{configuration.planner, energy_model, logger};
        const PlanResult result = planner.plan(segment_locations);

        for (const Cluster* cluster : result.state.all_clusters()) {
            const bool parked = cluster->is_hub() && result.state.hub.at_placeholder();
            logger->info(
                R"({{"component":"report","tour":{},"hub":{},"cells":{},"energy_j":{}}})",
                cluster->id(),
                cluster->is_hub() ? "true" : "false",
                parked ? 0 : cluster->cells().size(),
                energy_model->total_energy(result.state, cluster->id())
            );
        }
        logger->flush();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical(R"({{"component":"app","event":"fatal","error":"{}"}})", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
