#include "gwskynet/skymap/sanitize.hpp"

#include <cmath>
#include <limits>

namespace gwskynet::skymap {

bool is_invalid_sentinel(ChannelKind kind, double value) {
    switch (kind) {
        case ChannelKind::DISTMU:
            return value == std::numeric_limits<double>::infinity();
        case ChannelKind::DISTSIGMA:
            return value == 1.0;
        case ChannelKind::DISTNORM:
            return value == 0.0;
        default:
            return false;
    }
}

std::vector<double> sanitize_layer(ChannelKind kind, const std::vector<double>& values) {
    std::vector<double> out(values);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (double& v : out) {
        if (is_invalid_sentinel(kind, v)) v = nan;
    }
    return out;
}

SphericalMap sanitize_distance_layers(const SphericalMap& map) {
    SphericalMap out;
    out.nside = map.nside;
    out.ordering = map.ordering;
    out.layers[ChannelKind::SKYMAP] = map.layers[ChannelKind::SKYMAP];
    for (ChannelKind kind : kDistanceChannels) {
        out.layers[kind] = sanitize_layer(kind, map.layers[kind]);
    }
    return out;
}

} // namespace gwskynet::skymap
