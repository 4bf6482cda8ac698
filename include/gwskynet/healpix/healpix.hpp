#pragma once

#include "gwskynet/core/types.hpp"

#include <array>
#include <cstdint>

namespace gwskynet::healpix {

constexpr int kMaxOrder = 29;

// Four interpolation neighbours and their bilinear weights.
struct InterpolationWeights {
    std::array<int64_t, 4> pix{};
    std::array<double, 4> weight{};
};

// Ring description: first pixel index, pixel count, colatitude of the
// ring centres and whether the first pixel is offset by half a step.
struct RingInfo {
    int64_t start_pixel = 0;
    int64_t pixel_count = 0;
    double theta = 0.0;
    bool shifted = false;
};

// HEALPix pixelization at one resolution. Angles are (theta, phi) in
// radians: colatitude in [0, pi], longitude in [0, 2 pi).
// Only power-of-two nside values are supported (required for NESTED).
class HealpixGrid {
public:
    explicit HealpixGrid(int64_t nside);

    static HealpixGrid from_npix(int64_t npix);
    static bool is_valid_npix(int64_t npix, int64_t *nside_out = nullptr);

    int64_t nside() const { return nside_; }
    int order() const { return order_; }
    int64_t npix() const { return npix_; }
    double pixel_area() const;

    int64_t ang2pix_ring(double theta, double phi) const;
    int64_t ang2pix_nest(double theta, double phi) const;

    void pix2ang_ring(int64_t pix, double &theta, double &phi) const;
    void pix2ang_nest(int64_t pix, double &theta, double &phi) const;

    int64_t ring2nest(int64_t pix) const;
    int64_t nest2ring(int64_t pix) const;

    // Ring index is 1-based, 1 .. 4*nside-1.
    RingInfo ring_info(int64_t ring) const;

    // Bilinear interpolation neighbours (healpix_base::get_interpol).
    InterpolationWeights interpolation_weights(double theta, double phi,
                                               PixelOrdering ordering) const;

private:
    int64_t ring_above(double z) const;
    void ring2xyf(int64_t pix, int &ix, int &iy, int &face) const;
    int64_t xyf2ring(int ix, int iy, int face) const;
    void nest2xyf(int64_t pix, int &ix, int &iy, int &face) const;
    int64_t xyf2nest(int ix, int iy, int face) const;

    int64_t nside_;
    int order_;
    int64_t npface_;
    int64_t ncap_;
    int64_t npix_;
    double fact1_;
    double fact2_;
};

// Multi-order (NUNIQ) index helpers.
int64_t nside_for_order(int order);
bool uniq_to_order_ipix(int64_t uniq, int &order, int64_t &ipix);
int64_t order_ipix_to_uniq(int order, int64_t ipix);

} // namespace gwskynet::healpix
