#include "flower/field_generator.hpp"

#include <random>
#include <stdexcept>

namespace flower {

std::vector<Point2> generate_segment_field(std::size_t count, double width_m, double height_m, std::uint32_t seed) {
    if (width_m <= 0.0 || height_m <= 0.0) {
        throw std::invalid_argument("Field dimensions must be positive");
    }
    std::mt19937 generator{seed};
    std::uniform_real_distribution<double> distribution_x{0.0, width_m};
    std::uniform_real_distribution<double> distribution_y{0.0, height_m};

    std::vector<Point2> locations;
    locations.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        const double x_m = distribution_x(generator);
        const double y_m = distribution_y(generator);
        locations.push_back(Point2{x_m, y_m});
    }
    return locations;
}

}  // namespace flower
