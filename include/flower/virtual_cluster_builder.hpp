// === Virtual Cluster Builder =================================================
//
// Reduces the cover to (agent count - 1) provisional clusters by repeatedly
// merging the two nearest ones, then labels them 0..k-1 by polar angle so that
// consecutive ids are angular neighbours. Growth and balancing rely on
// "|id difference| == 1" as their adjacency test.

#pragma once

#include <memory>
#include <vector>

#include <spdlog/logger.h>

#include "flower/cluster.hpp"
#include "flower/grid.hpp"

namespace flower {

/**
 * @brief Merge the two clusters with the nearest centroids.
 *
 * The later cluster's cells are appended to the earlier one; the list shrinks by
 * one. Lists with fewer than two clusters are returned unchanged.
 */
[[nodiscard]] std::vector<VirtualCluster> combine_clusters(const Grid& grid, std::vector<VirtualCluster> clusters);

/**
 * @brief Order clusters by polar angle around the lexicographically smallest centroid.
 */
[[nodiscard]] std::vector<VirtualCluster> polar_sort(std::vector<VirtualCluster> clusters);

/** @brief Builds and labels the virtual clusters that seed tour growth. */
class VirtualClusterBuilder final {
  public:
    explicit VirtualClusterBuilder(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Group @p cover into exactly @p agent_count - 1 virtual clusters.
     *
     * Member cells of each cluster are stamped with its virtual tour id.
     */
    [[nodiscard]] std::vector<VirtualCluster> build(Grid& grid, const std::vector<CellId>& cover, int agent_count) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flower
