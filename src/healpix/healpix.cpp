#include "gwskynet/healpix/healpix.hpp"
#include "gwskynet/core/errors.hpp"

#include <cmath>
#include <string>

namespace gwskynet::healpix {

namespace {

constexpr double kPi = 3.141592653589793238462643383279502884197;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kHalfPi = 0.5 * kPi;
constexpr double kTwoThird = 2.0 / 3.0;

// Face layout (ring number / phi offset of each base pixel's corner).
constexpr int kJrll[12] = {2, 2, 2, 2, 3, 3, 3, 3, 4, 4, 4, 4};
constexpr int kJpll[12] = {1, 3, 5, 7, 0, 2, 4, 6, 1, 3, 5, 7};

int64_t isqrt(int64_t v) {
    int64_t r = static_cast<int64_t>(std::sqrt(static_cast<double>(v) + 0.5));
    while (r * r > v) --r;
    while ((r + 1) * (r + 1) <= v) ++r;
    return r;
}

int64_t spread_bits(int v) {
    int64_t out = 0;
    for (int b = 0; b < 32; ++b) {
        out |= static_cast<int64_t>((v >> b) & 1) << (2 * b);
    }
    return out;
}

int compress_bits(int64_t v) {
    int out = 0;
    for (int b = 0; b < 32; ++b) {
        out |= static_cast<int>((v >> (2 * b)) & 1) << b;
    }
    return out;
}

double fmodulo(double v1, double v2) {
    if (v1 >= 0) return (v1 < v2) ? v1 : std::fmod(v1, v2);
    double tmp = std::fmod(v1, v2) + v2;
    return (tmp == v2) ? 0.0 : tmp;
}

int ilog2(int64_t v) {
    int r = 0;
    while (v > 1) {
        v >>= 1;
        ++r;
    }
    return r;
}

} // namespace

HealpixGrid::HealpixGrid(int64_t nside) : nside_(nside) {
    if (nside < 1 || (nside & (nside - 1)) != 0) {
        throw ValidationError("HEALPix nside must be a positive power of two, got " +
                              std::to_string(nside));
    }
    order_ = ilog2(nside);
    if (order_ > kMaxOrder) {
        throw ValidationError("HEALPix order exceeds " + std::to_string(kMaxOrder));
    }
    npface_ = nside_ * nside_;
    ncap_ = (npface_ - nside_) << 1;
    npix_ = 12 * npface_;
    fact2_ = 4.0 / static_cast<double>(npix_);
    fact1_ = static_cast<double>(nside_ << 1) * fact2_;
}

bool HealpixGrid::is_valid_npix(int64_t npix, int64_t *nside_out) {
    if (npix < 12 || npix % 12 != 0) return false;
    int64_t nside = isqrt(npix / 12);
    if (nside * nside * 12 != npix) return false;
    if ((nside & (nside - 1)) != 0) return false;
    if (nside_out) *nside_out = nside;
    return true;
}

HealpixGrid HealpixGrid::from_npix(int64_t npix) {
    int64_t nside = 0;
    if (!is_valid_npix(npix, &nside)) {
        throw ValidationError("Invalid HEALPix pixel count " + std::to_string(npix));
    }
    return HealpixGrid(nside);
}

double HealpixGrid::pixel_area() const {
    return 4.0 * kPi / static_cast<double>(npix_);
}

int64_t HealpixGrid::ang2pix_ring(double theta, double phi) const {
    const double z = std::cos(theta);
    const double za = std::abs(z);
    const double tt = fmodulo(phi / kHalfPi, 4.0); // in [0,4)

    if (za <= kTwoThird) {
        // Equatorial region
        const int64_t nl4 = 4 * nside_;
        const double temp1 = nside_ * (0.5 + tt);
        const double temp2 = nside_ * z * 0.75;
        const int64_t jp = static_cast<int64_t>(temp1 - temp2); // ascending edge line
        const int64_t jm = static_cast<int64_t>(temp1 + temp2); // descending edge line
        const int64_t ir = nside_ + 1 + jp - jm;                // ring counted from z=2/3
        const int64_t kshift = 1 - (ir & 1);
        const int64_t t1 = jp + jm - nside_ + kshift + 1 + nl4 + nl4;
        const int64_t ip = (t1 >> 1) & (nl4 - 1);
        return ncap_ + (ir - 1) * nl4 + ip;
    }

    // Polar caps
    const double tp = tt - static_cast<int64_t>(tt);
    const double tmp = nside_ * std::sqrt(3.0 * (1.0 - za));
    const int64_t jp = static_cast<int64_t>(tp * tmp);
    const int64_t jm = static_cast<int64_t>((1.0 - tp) * tmp);
    const int64_t ir = jp + jm + 1; // ring counted from the closest pole
    int64_t ip = static_cast<int64_t>(tt * ir);
    if (ip >= 4 * ir) ip = 4 * ir - 1;
    return (z > 0) ? 2 * ir * (ir - 1) + ip : npix_ - 2 * ir * (ir + 1) + ip;
}

int64_t HealpixGrid::ang2pix_nest(double theta, double phi) const {
    return ring2nest(ang2pix_ring(theta, phi));
}

void HealpixGrid::pix2ang_ring(int64_t pix, double &theta, double &phi) const {
    double z = 0.0;
    if (pix < ncap_) {
        // North polar cap
        const int64_t iring = (1 + isqrt(1 + 2 * pix)) >> 1;
        const int64_t iphi = (pix + 1) - 2 * iring * (iring - 1);
        z = 1.0 - static_cast<double>(iring * iring) * fact2_;
        phi = (static_cast<double>(iphi) - 0.5) * kHalfPi / static_cast<double>(iring);
    } else if (pix < (npix_ - ncap_)) {
        // Equatorial region
        const int64_t nl4 = 4 * nside_;
        const int64_t ip = pix - ncap_;
        const int64_t tmp = ip / nl4;
        const int64_t iring = tmp + nside_;
        const int64_t iphi = ip - nl4 * tmp + 1;
        const double fodd = ((iring + nside_) & 1) ? 1.0 : 0.5;
        z = static_cast<double>(2 * nside_ - iring) * fact1_;
        phi = (static_cast<double>(iphi) - fodd) * kPi * 0.75 * fact1_;
    } else {
        // South polar cap
        const int64_t ip = npix_ - pix;
        const int64_t iring = (1 + isqrt(2 * ip - 1)) >> 1;
        const int64_t iphi = 4 * iring + 1 - (ip - 2 * iring * (iring - 1));
        z = static_cast<double>(iring * iring) * fact2_ - 1.0;
        phi = (static_cast<double>(iphi) - 0.5) * kHalfPi / static_cast<double>(iring);
    }
    theta = std::acos(z);
}

void HealpixGrid::pix2ang_nest(int64_t pix, double &theta, double &phi) const {
    pix2ang_ring(nest2ring(pix), theta, phi);
}

void HealpixGrid::nest2xyf(int64_t pix, int &ix, int &iy, int &face) const {
    face = static_cast<int>(pix >> (2 * order_));
    pix &= (npface_ - 1);
    ix = compress_bits(pix);
    iy = compress_bits(pix >> 1);
}

int64_t HealpixGrid::xyf2nest(int ix, int iy, int face) const {
    return (static_cast<int64_t>(face) << (2 * order_)) + spread_bits(ix) + (spread_bits(iy) << 1);
}

void HealpixGrid::ring2xyf(int64_t pix, int &ix, int &iy, int &face) const {
    int64_t iring, iphi, kshift, nr;
    const int64_t nl2 = 2 * nside_;

    if (pix < ncap_) {
        iring = (1 + isqrt(1 + 2 * pix)) >> 1;
        iphi = (pix + 1) - 2 * iring * (iring - 1);
        kshift = 0;
        nr = iring;
        face = static_cast<int>((iphi - 1) / nr);
    } else if (pix < (npix_ - ncap_)) {
        const int64_t ip = pix - ncap_;
        const int64_t tmp = ip / (4 * nside_);
        iring = tmp + nside_;
        iphi = ip - tmp * 4 * nside_ + 1;
        kshift = (iring + nside_) & 1;
        nr = nside_;
        const int64_t ire = tmp + 1;
        const int64_t irm = nl2 + 1 - tmp;
        const int64_t ifm = (iphi - (ire >> 1) + nside_ - 1) >> order_;
        const int64_t ifp = (iphi - (irm >> 1) + nside_ - 1) >> order_;
        face = static_cast<int>((ifp == ifm) ? (ifp | 4) : ((ifp < ifm) ? ifp : (ifm + 8)));
    } else {
        const int64_t ip = npix_ - pix;
        iring = (1 + isqrt(2 * ip - 1)) >> 1;
        iphi = 4 * iring + 1 - (ip - 2 * iring * (iring - 1));
        kshift = 0;
        nr = iring;
        iring = 2 * nl2 - iring;
        face = static_cast<int>((iphi - 1) / nr + 8);
    }

    const int64_t irt = iring - ((2 + (face >> 2)) * nside_) + 1;
    int64_t ipt = 2 * iphi - kJpll[face] * nr - kshift - 1;
    if (ipt >= nl2) ipt -= 8 * nside_;

    ix = static_cast<int>((ipt - irt) >> 1);
    iy = static_cast<int>((-ipt - irt) >> 1);
}

int64_t HealpixGrid::xyf2ring(int ix, int iy, int face) const {
    const int64_t nl4 = 4 * nside_;
    const int64_t jr = (kJrll[face] * nside_) - ix - iy - 1;

    int64_t n_before, nr;
    bool shifted;
    if (jr < nside_) {
        shifted = true;
        nr = 4 * jr;
        n_before = 2 * jr * (jr - 1);
    } else if (jr < 3 * nside_) {
        shifted = ((jr - nside_) & 1) == 0;
        nr = 4 * nside_;
        n_before = ncap_ + (jr - nside_) * nr;
    } else {
        shifted = true;
        const int64_t nrs = 4 * nside_ - jr;
        nr = 4 * nrs;
        n_before = npix_ - 2 * nrs * (nrs + 1);
    }
    nr >>= 2;
    const int64_t kshift = shifted ? 0 : 1;
    int64_t jp = (kJpll[face] * nr + ix - iy + 1 + kshift) / 2;
    if (jp < 1) jp += nl4;

    return n_before + jp - 1;
}

int64_t HealpixGrid::ring2nest(int64_t pix) const {
    int ix, iy, face;
    ring2xyf(pix, ix, iy, face);
    return xyf2nest(ix, iy, face);
}

int64_t HealpixGrid::nest2ring(int64_t pix) const {
    int ix, iy, face;
    nest2xyf(pix, ix, iy, face);
    return xyf2ring(ix, iy, face);
}

int64_t HealpixGrid::ring_above(double z) const {
    const double az = std::abs(z);
    if (az <= kTwoThird) {
        return static_cast<int64_t>(nside_ * (2.0 - 1.5 * z));
    }
    const int64_t iring = static_cast<int64_t>(nside_ * std::sqrt(3.0 * (1.0 - az)));
    return (z > 0) ? iring : 4 * nside_ - iring - 1;
}

RingInfo HealpixGrid::ring_info(int64_t ring) const {
    RingInfo info;
    const int64_t northring = (ring > 2 * nside_) ? 4 * nside_ - ring : ring;
    if (northring < nside_) {
        const double tmp = static_cast<double>(northring * northring) * fact2_;
        const double costheta = 1.0 - tmp;
        const double sintheta = std::sqrt(tmp * (2.0 - tmp));
        info.theta = std::atan2(sintheta, costheta);
        info.pixel_count = 4 * northring;
        info.shifted = true;
        info.start_pixel = 2 * northring * (northring - 1);
    } else {
        info.theta = std::acos(static_cast<double>(2 * nside_ - northring) * fact1_);
        info.pixel_count = 4 * nside_;
        info.shifted = ((northring - nside_) & 1) == 0;
        info.start_pixel = ncap_ + (northring - nside_) * info.pixel_count;
    }
    if (northring != ring) {
        // southern hemisphere
        info.theta = kPi - info.theta;
        info.start_pixel = npix_ - info.start_pixel - info.pixel_count;
    }
    return info;
}

InterpolationWeights HealpixGrid::interpolation_weights(double theta, double phi,
                                                        PixelOrdering ordering) const {
    if (!(theta >= 0.0 && theta <= kPi)) {
        throw ValidationError("interpolation colatitude out of range");
    }
    phi = fmodulo(phi, kTwoPi);

    InterpolationWeights out;
    auto &pix = out.pix;
    auto &wgt = out.weight;

    const double z = std::cos(theta);
    const int64_t ir1 = ring_above(z);
    const int64_t ir2 = ir1 + 1;
    double theta1 = 0.0;
    double theta2 = 0.0;

    auto fill_ring = [&](int64_t ring, std::size_t slot, double &ring_theta) {
        RingInfo info = ring_info(ring);
        ring_theta = info.theta;
        const int64_t nr = info.pixel_count;
        const double dphi = kTwoPi / static_cast<double>(nr);
        const double shift = info.shifted ? 0.5 : 0.0;
        const double tmp = phi / dphi - shift;
        int64_t i1 = (tmp < 0) ? static_cast<int64_t>(tmp) - 1 : static_cast<int64_t>(tmp);
        const double w1 = (phi - (static_cast<double>(i1) + shift) * dphi) / dphi;
        int64_t i2 = i1 + 1;
        if (i1 < 0) i1 += nr;
        if (i2 >= nr) i2 -= nr;
        pix[slot] = info.start_pixel + i1;
        pix[slot + 1] = info.start_pixel + i2;
        wgt[slot] = 1.0 - w1;
        wgt[slot + 1] = w1;
    };

    if (ir1 > 0) fill_ring(ir1, 0, theta1);
    if (ir2 < 4 * nside_) fill_ring(ir2, 2, theta2);

    if (ir1 == 0) {
        // North pole: the missing ring is replaced by the opposite pixels of ring 1.
        const double wtheta = theta / theta2;
        wgt[2] *= wtheta;
        wgt[3] *= wtheta;
        const double fac = (1.0 - wtheta) * 0.25;
        wgt[0] = fac;
        wgt[1] = fac;
        wgt[2] += fac;
        wgt[3] += fac;
        pix[0] = (pix[2] + 2) & 3;
        pix[1] = (pix[3] + 2) & 3;
    } else if (ir2 == 4 * nside_) {
        const double wtheta = (theta - theta1) / (kPi - theta1);
        wgt[0] *= (1.0 - wtheta);
        wgt[1] *= (1.0 - wtheta);
        const double fac = wtheta * 0.25;
        wgt[0] += fac;
        wgt[1] += fac;
        wgt[2] = fac;
        wgt[3] = fac;
        pix[2] = ((pix[0] + 2) & 3) + npix_ - 4;
        pix[3] = ((pix[1] + 2) & 3) + npix_ - 4;
    } else {
        const double wtheta = (theta - theta1) / (theta2 - theta1);
        wgt[0] *= (1.0 - wtheta);
        wgt[1] *= (1.0 - wtheta);
        wgt[2] *= wtheta;
        wgt[3] *= wtheta;
    }

    if (ordering == PixelOrdering::NESTED) {
        for (auto &p : pix) {
            p = ring2nest(p);
        }
    }
    return out;
}

int64_t nside_for_order(int order) {
    if (order < 0 || order > kMaxOrder) {
        throw ValidationError("HEALPix order out of range: " + std::to_string(order));
    }
    return int64_t(1) << order;
}

bool uniq_to_order_ipix(int64_t uniq, int &order, int64_t &ipix) {
    if (uniq < 4) return false;
    const int msb = ilog2(uniq);
    order = (msb - 2) / 2;
    if (order > kMaxOrder) return false;
    ipix = uniq - (int64_t(4) << (2 * order));
    return ipix >= 0 && ipix < 12 * (int64_t(1) << (2 * order));
}

int64_t order_ipix_to_uniq(int order, int64_t ipix) {
    return (int64_t(4) << (2 * order)) + ipix;
}

} // namespace gwskynet::healpix
