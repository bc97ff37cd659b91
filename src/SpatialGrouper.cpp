#include "geomap/SpatialGrouper.hpp"

#include <cmath>
#include <utility>

namespace geomap {

SpatialGrouper::SpatialGrouper(const GroupingConfig &config)
    : m_config(config) {}

bool SpatialGrouper::isNearby(const Coordinate &a, const Coordinate &b) const {
  return std::fabs(a.groupingLat() - b.groupingLat()) < m_config.threshold &&
         std::fabs(a.groupingLon() - b.groupingLon()) < m_config.threshold;
}

std::vector<std::vector<Coordinate>>
SpatialGrouper::group(const std::vector<Coordinate> &coordinates) const {
  std::vector<std::vector<Coordinate>> groups;
  std::vector<bool> used(coordinates.size(), false);

  for (size_t i = 0; i < coordinates.size(); i++) {
    if (used[i])
      continue;

    std::vector<Coordinate> current{coordinates[i]};
    used[i] = true;

    for (size_t j = i + 1; j < coordinates.size(); j++) {
      if (used[j])
        continue;

      if (isNearby(coordinates[i], coordinates[j])) {
        current.push_back(coordinates[j]);
        used[j] = true;
      }
    }

    groups.push_back(std::move(current));
  }

  return groups;
}

} // namespace geomap
