#include "gwskynet/image/normalization.hpp"
#include "gwskynet/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace gwskynet::image {

Matrix2Dd fill_missing(const Matrix2Dd &values) {
  Matrix2Dd out = values;
  const double big = std::numeric_limits<double>::max();
  for (Eigen::Index i = 0; i < out.size(); ++i) {
    double &v = out.data()[i];
    if (std::isnan(v)) {
      v = 0.0;
    } else if (std::isinf(v)) {
      v = (v > 0) ? big : -big;
    }
  }
  return out;
}

ScaledChannel normalize_channel(const projection::RectGrid &grid,
                                double training_constant) {
  if (!(training_constant > 0.0)) {
    throw ValidationError("training normalization constant must be > 0");
  }

  ScaledChannel out;
  out.grid.geometry = grid.geometry;
  out.grid.values = fill_missing(grid.values);

  if (out.grid.values.size() == 0) {
    return out;
  }

  out.peak = out.grid.values.maxCoeff();
  if (out.peak == 0.0) {
    out.grid.values.setZero();
    out.norm = 0.0;
    return out;
  }

  out.grid.values /= out.peak;
  out.norm = out.peak / training_constant;
  return out;
}

projection::RectGrid max_pool_2x2(const projection::RectGrid &grid) {
  const Eigen::Index rows = grid.values.rows();
  const Eigen::Index cols = grid.values.cols();
  if (rows == 0 || cols == 0 || (rows % 2) != 0 || (cols % 2) != 0) {
    throw UnsupportedGridShapeError("2x2 pooling needs even non-zero dimensions, got " +
                                    std::to_string(rows) + "x" + std::to_string(cols));
  }

  projection::RectGrid out;
  out.geometry = grid.geometry.pooled_2x2();
  out.values.resize(rows / 2, cols / 2);

  for (Eigen::Index y = 0; y < rows / 2; ++y) {
    for (Eigen::Index x = 0; x < cols / 2; ++x) {
      const double a = grid.values(2 * y, 2 * x);
      const double b = grid.values(2 * y, 2 * x + 1);
      const double c = grid.values(2 * y + 1, 2 * x);
      const double d = grid.values(2 * y + 1, 2 * x + 1);
      out.values(y, x) = std::max(std::max(a, b), std::max(c, d));
    }
  }
  return out;
}

} // namespace gwskynet::image
