#pragma once

#include "gwskynet/core/types.hpp"
#include "gwskynet/healpix/healpix.hpp"
#include "gwskynet/projection/car_geometry.hpp"
#include "gwskynet/skymap/skymap.hpp"

#include <cstdint>
#include <vector>

namespace gwskynet::projection {

// Rectangular grid in FITS row order (row 0 = first latitude row).
// NaN marks an undefined cell.
struct RectGrid {
    Matrix2Dd values;
    CarGeometry geometry;
};

// Per-cell interpolation stencil; shared by all layers of one map.
struct ReprojectionPlan {
    CarGeometry geometry;
    std::vector<healpix::InterpolationWeights> cells; // row-major, empty stencil = off-sky
    std::vector<bool> on_sky;
};

ReprojectionPlan make_reprojection_plan(int64_t nside, PixelOrdering ordering,
                                        const CarGeometry& geometry);

// Bilinear resampling of one HEALPix layer. A cell is undefined when it is
// off the sphere or when any of its four neighbours is missing, whatever
// its weight.
RectGrid apply_reprojection_plan(const ReprojectionPlan& plan, const std::vector<double>& values);

RectGrid reproject_layer(const std::vector<double>& values, int64_t nside,
                         PixelOrdering ordering, const CarGeometry& geometry);

ChannelArray<RectGrid> reproject_map(const skymap::SphericalMap& map,
                                     const CarGeometry& geometry);

} // namespace gwskynet::projection
