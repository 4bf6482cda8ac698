#pragma once

#include "gwskynet/skymap/skymap.hpp"

#include <vector>

namespace gwskynet::skymap {

// Sentinel conventions for the distance layers: DISTMU == +inf,
// DISTSIGMA == 1, DISTNORM == 0 mark pixels without distance information.
// Comparison is exact. The SKYMAP layer has no sentinel.
bool is_invalid_sentinel(ChannelKind kind, double value);

std::vector<double> sanitize_layer(ChannelKind kind, const std::vector<double>& values);

// Returns a copy with every sentinel replaced by NaN.
SphericalMap sanitize_distance_layers(const SphericalMap& map);

} // namespace gwskynet::skymap
