#pragma once

#include "gwskynet/core/types.hpp"
#include "gwskynet/projection/reproject.hpp"

namespace gwskynet::image {

// Output of per-channel peak normalization.
struct ScaledChannel {
  projection::RectGrid grid; // values in [.., 1], peak cell == 1
  double peak = 0.0;         // maximum before scaling
  double norm = 0.0;         // peak / training constant
};

// Pooled, unit-scaled channel plus its retained norm (a model input).
struct NormalizedChannel {
  projection::RectGrid grid;
  double norm = 0.0;
};

// NaN -> 0, +/-inf -> +/-max double (numpy.nan_to_num semantics).
Matrix2Dd fill_missing(const Matrix2Dd &values);

// Divides by the channel maximum and derives norm = peak / training_constant.
// A zero peak yields an all-zero grid and norm 0.
ScaledChannel normalize_channel(const projection::RectGrid &grid,
                                double training_constant);

// Non-overlapping 2x2 max pooling. Both dimensions must be even and
// non-zero, otherwise UnsupportedGridShapeError.
projection::RectGrid max_pool_2x2(const projection::RectGrid &grid);

} // namespace gwskynet::image
