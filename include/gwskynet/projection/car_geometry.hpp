#pragma once

#include <cmath>

namespace gwskynet::projection {

// Plate carree (CAR) grid in celestial ICRS coordinates.
// FITS conventions: reference pixel is 1-indexed, row 0 is the lowest
// latitude, a negative CDELT1 makes longitude increase right-to-left.
struct CarGeometry {
    int naxis1 = 360;
    int naxis2 = 180;

    double crpix1 = 180.5;
    double crpix2 = 90.5;

    double crval1 = 180.0;  // RA at reference pixel (degrees)
    double crval2 = 0.0;    // Dec at reference pixel (degrees)

    double cdelt1 = -1.0;
    double cdelt2 = 1.0;

    // Pixel (0-indexed) -> world (lon in [0, 360), lat in degrees).
    // Returns false when the latitude falls off the sphere.
    bool pixel_to_world(double px, double py, double &lon_deg, double &lat_deg) const {
        lon_deg = crval1 + cdelt1 * ((px + 1.0) - crpix1);
        lat_deg = crval2 + cdelt2 * ((py + 1.0) - crpix2);

        lon_deg = std::fmod(lon_deg, 360.0);
        if (lon_deg < 0.0) lon_deg += 360.0;

        return lat_deg >= -90.0 && lat_deg <= 90.0;
    }

    // World -> pixel (0-indexed). Longitude is wrapped to the branch
    // closest to the reference value.
    void world_to_pixel(double lon_deg, double lat_deg, double &px, double &py) const {
        double dlon = std::fmod(lon_deg - crval1, 360.0);
        if (dlon > 180.0) dlon -= 360.0;
        if (dlon <= -180.0) dlon += 360.0;
        px = dlon / cdelt1 + crpix1 - 1.0;
        py = (lat_deg - crval2) / cdelt2 + crpix2 - 1.0;
    }

    // Geometry of the grid produced by non-overlapping 2x2 pooling.
    CarGeometry pooled_2x2() const {
        CarGeometry g = *this;
        g.naxis1 = naxis1 / 2;
        g.naxis2 = naxis2 / 2;
        g.crpix1 = (crpix1 - 0.5) / 2.0 + 0.5;
        g.crpix2 = (crpix2 - 0.5) / 2.0 + 0.5;
        g.cdelt1 = cdelt1 * 2.0;
        g.cdelt2 = cdelt2 * 2.0;
        return g;
    }

    bool valid() const {
        return naxis1 > 0 && naxis2 > 0 && cdelt1 != 0.0 && cdelt2 != 0.0;
    }

    bool operator==(const CarGeometry &o) const {
        return naxis1 == o.naxis1 && naxis2 == o.naxis2 &&
               crpix1 == o.crpix1 && crpix2 == o.crpix2 &&
               crval1 == o.crval1 && crval2 == o.crval2 &&
               cdelt1 == o.cdelt1 && cdelt2 == o.cdelt2;
    }
    bool operator!=(const CarGeometry &o) const { return !(*this == o); }
};

} // namespace gwskynet::projection
