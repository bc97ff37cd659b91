#ifndef GEOMAP_SPATIAL_GROUPER_HPP
#define GEOMAP_SPATIAL_GROUPER_HPP

#include "geomap/GeoTypes.hpp"
#include "geomap/PipelineConfig.hpp"

#include <vector>

namespace geomap {

/**
 * @brief Clusters coordinates that lie close to each other
 *
 * Two coordinates are nearby when both |dlat| and |dlon| of their grouping
 * points are below the threshold. Clustering is a single greedy pass in input
 * order: each coordinate not yet assigned opens a group and absorbs every
 * later unassigned coordinate that is near it. The result is first-fit, not
 * globally optimal, and is deterministic for a given input order.
 */
class SpatialGrouper {
public:
  SpatialGrouper() = default;
  explicit SpatialGrouper(const GroupingConfig &config);

  std::vector<std::vector<Coordinate>>
  group(const std::vector<Coordinate> &coordinates) const;

  bool isNearby(const Coordinate &a, const Coordinate &b) const;

private:
  GroupingConfig m_config;
};

} // namespace geomap

#endif // GEOMAP_SPATIAL_GROUPER_HPP
