#include "flower/virtual_cluster_builder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "flower/proximity.hpp"

namespace flower {

std::vector<VirtualCluster> combine_clusters(const Grid& grid, std::vector<VirtualCluster> clusters) {
    if (clusters.size() < 2) {
        return clusters;
    }

    std::size_t keep_index = 0;
    std::size_t merge_index = 1;
    double best_distance_m = std::numeric_limits<double>::infinity();
    for (std::size_t lhs = 0; lhs < clusters.size(); ++lhs) {
        for (std::size_t rhs = lhs + 1; rhs < clusters.size(); ++rhs) {
            const double candidate_m = distance_m(clusters[lhs].location, clusters[rhs].location);
            if (candidate_m < best_distance_m) {
                best_distance_m = candidate_m;
                keep_index = lhs;
                merge_index = rhs;
            }
        }
    }

    VirtualCluster& kept = clusters[keep_index];
    const VirtualCluster& merged = clusters[merge_index];
    kept.cells.insert(kept.cells.end(), merged.cells.begin(), merged.cells.end());
    kept.location = centroid(grid, kept.cells);
    clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(merge_index));
    return clusters;
}

std::vector<VirtualCluster> polar_sort(std::vector<VirtualCluster> clusters) {
    if (clusters.empty()) {
        return clusters;
    }

    const auto iterator_origin = std::min_element(
        clusters.begin(),
        clusters.end(),
        [](const VirtualCluster& lhs, const VirtualCluster& rhs) {
            if (lhs.location.x_m != rhs.location.x_m) {
                return lhs.location.x_m < rhs.location.x_m;
            }
            return lhs.location.y_m < rhs.location.y_m;
        }
    );
    const Point2 origin = iterator_origin->location;

    std::vector<double> polar_angles;
    polar_angles.reserve(clusters.size());
    for (const VirtualCluster& cluster : clusters) {
        polar_angles.push_back(std::atan2(cluster.location.y_m - origin.y_m, cluster.location.x_m - origin.x_m));
    }

    std::vector<std::size_t> indexes(clusters.size());
    std::iota(indexes.begin(), indexes.end(), std::size_t{0});
    std::stable_sort(indexes.begin(), indexes.end(), [&polar_angles](std::size_t lhs, std::size_t rhs) {
        return polar_angles[lhs] < polar_angles[rhs];
    });

    std::vector<VirtualCluster> sorted_clusters;
    sorted_clusters.reserve(clusters.size());
    for (const std::size_t index : indexes) {
        sorted_clusters.push_back(std::move(clusters[index]));
    }
    return sorted_clusters;
}

VirtualClusterBuilder::VirtualClusterBuilder(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

std::vector<VirtualCluster> VirtualClusterBuilder::build(Grid& grid, const std::vector<CellId>& cover, int agent_count) const {
    if (agent_count < 2) {
        throw std::invalid_argument("Virtual clusters require at least two relay agents");
    }
    const auto target_count = static_cast<std::size_t>(agent_count - 1);
    if (cover.size() < target_count) {
        throw std::invalid_argument("Cover is smaller than the number of virtual clusters requested");
    }

    std::vector<VirtualCluster> virtual_clusters;
    virtual_clusters.reserve(cover.size());
    for (const CellId cell : cover) {
        virtual_clusters.push_back(VirtualCluster{
            static_cast<int>(virtual_clusters.size()),
            {cell},
            grid.cell(cell).location
        });
    }

    while (virtual_clusters.size() > target_count) {
        virtual_clusters = combine_clusters(grid, std::move(virtual_clusters));
        logger_->debug(R"({{"component":"virtual_clusters","remaining":{}}})", virtual_clusters.size());
    }

    virtual_clusters = polar_sort(std::move(virtual_clusters));
    for (std::size_t index = 0; index < virtual_clusters.size(); ++index) {
        VirtualCluster& virtual_cluster = virtual_clusters[index];
        virtual_cluster.id = static_cast<int>(index);
        for (const CellId cell : virtual_cluster.cells) {
            grid.cell(cell).virtual_tour_id = virtual_cluster.id;
            logger_->debug(R"({{"component":"virtual_clusters","cell":{},"virtual_cluster":{}}})", cell, virtual_cluster.id);
        }
    }

    logger_->info(
        R"({{"component":"virtual_clusters","count":{},"cover_cells":{}}})",
        virtual_clusters.size(),
        cover.size()
    );
    return virtual_clusters;
}

}  // namespace flower
