#include "gwskynet/projection/reproject.hpp"
#include "gwskynet/core/errors.hpp"

#include <limits>
#include <string>

namespace gwskynet::projection {

namespace {
constexpr double kDeg2Rad = 3.141592653589793238462643383279502884197 / 180.0;
}

ReprojectionPlan make_reprojection_plan(int64_t nside, PixelOrdering ordering,
                                        const CarGeometry& geometry) {
    if (!geometry.valid()) {
        throw ValidationError("invalid target grid geometry");
    }
    healpix::HealpixGrid grid(nside);

    ReprojectionPlan plan;
    plan.geometry = geometry;
    const std::size_t ncells = static_cast<std::size_t>(geometry.naxis1) *
                               static_cast<std::size_t>(geometry.naxis2);
    plan.cells.resize(ncells);
    plan.on_sky.assign(ncells, false);

    for (int y = 0; y < geometry.naxis2; ++y) {
        for (int x = 0; x < geometry.naxis1; ++x) {
            const std::size_t idx = static_cast<std::size_t>(y) * geometry.naxis1 + x;
            double lon = 0.0;
            double lat = 0.0;
            if (!geometry.pixel_to_world(x, y, lon, lat)) continue;

            const double theta = (90.0 - lat) * kDeg2Rad;
            const double phi = lon * kDeg2Rad;
            plan.cells[idx] = grid.interpolation_weights(theta, phi, ordering);
            plan.on_sky[idx] = true;
        }
    }
    return plan;
}

RectGrid apply_reprojection_plan(const ReprojectionPlan& plan, const std::vector<double>& values) {
    const auto& g = plan.geometry;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    RectGrid out;
    out.geometry = g;
    out.values = Matrix2Dd::Constant(g.naxis2, g.naxis1, nan);

    for (int y = 0; y < g.naxis2; ++y) {
        for (int x = 0; x < g.naxis1; ++x) {
            const std::size_t idx = static_cast<std::size_t>(y) * g.naxis1 + x;
            if (!plan.on_sky[idx]) continue;

            const auto& stencil = plan.cells[idx];
            // Zero weights still multiply, so any missing neighbour leaves the cell NaN.
            double acc = 0.0;
            for (std::size_t k = 0; k < 4; ++k) {
                const auto p = static_cast<std::size_t>(stencil.pix[k]);
                if (p >= values.size()) {
                    throw MalformedSkyMapError("interpolation neighbour " + std::to_string(p) +
                                               " outside layer of size " +
                                               std::to_string(values.size()));
                }
                acc += stencil.weight[k] * values[p];
            }
            out.values(y, x) = acc;
        }
    }
    return out;
}

RectGrid reproject_layer(const std::vector<double>& values, int64_t nside,
                         PixelOrdering ordering, const CarGeometry& geometry) {
    return apply_reprojection_plan(make_reprojection_plan(nside, ordering, geometry), values);
}

ChannelArray<RectGrid> reproject_map(const skymap::SphericalMap& map,
                                     const CarGeometry& geometry) {
    const auto expected = static_cast<std::size_t>(12 * map.nside * map.nside);
    for (ChannelKind kind : kAllChannels) {
        if (map.layers[kind].size() != expected) {
            throw MalformedSkyMapError(channel_to_string(kind) + " layer has " +
                                       std::to_string(map.layers[kind].size()) +
                                       " pixels, nside " + std::to_string(map.nside) +
                                       " needs " + std::to_string(expected));
        }
    }

    ReprojectionPlan plan = make_reprojection_plan(map.nside, map.ordering, geometry);

    ChannelArray<RectGrid> out;
    for (ChannelKind kind : kAllChannels) {
        out[kind] = apply_reprojection_plan(plan, map.layers[kind]);
    }
    return out;
}

} // namespace gwskynet::projection
