#include "gwskynet/image/normalization.hpp"
#include "gwskynet/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace gwskynet;

namespace {

projection::RectGrid make_grid(int rows, int cols) {
    projection::RectGrid g;
    g.geometry.naxis1 = cols;
    g.geometry.naxis2 = rows;
    g.values = Matrix2Dd::Zero(rows, cols);
    return g;
}

} // namespace

TEST_CASE("normalized_channel_peaks_at_one") {
    auto g = make_grid(4, 6);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 6; ++x) {
            g.values(y, x) = 0.5 * y + 0.1 * x;
        }
    }
    auto out = image::normalize_channel(g, 2.0);
    REQUIRE(out.grid.values.maxCoeff() == Catch::Approx(1.0));
    REQUIRE(out.peak == Catch::Approx(2.0));
    REQUIRE(out.norm == Catch::Approx(1.0));
    REQUIRE(out.grid.values(1, 1) == Catch::Approx(0.6 / 2.0));
}

TEST_CASE("zero_channel_stays_zero_with_zero_norm") {
    auto g = make_grid(4, 4);
    auto out = image::normalize_channel(g, 0.003);
    REQUIRE(out.norm == 0.0);
    REQUIRE(out.grid.values.isZero());
}

TEST_CASE("missing_cells_become_zero_before_scaling") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("all missing channel") {
        auto g = make_grid(2, 2);
        g.values.setConstant(nan);
        auto out = image::normalize_channel(g, 12000.0);
        REQUIRE(out.norm == 0.0);
        REQUIRE(out.grid.values.isZero());
    }

    SECTION("partially missing channel") {
        auto g = make_grid(2, 2);
        g.values << nan, 4.0,
                    2.0, nan;
        auto out = image::normalize_channel(g, 8.0);
        REQUIRE(out.grid.values(0, 0) == 0.0);
        REQUIRE(out.grid.values(0, 1) == Catch::Approx(1.0));
        REQUIRE(out.grid.values(1, 0) == Catch::Approx(0.5));
        REQUIRE(out.norm == Catch::Approx(0.5));
    }
}

TEST_CASE("fill_missing_clamps_infinities") {
    const double inf = std::numeric_limits<double>::infinity();
    Matrix2Dd m(1, 3);
    m << std::numeric_limits<double>::quiet_NaN(), inf, -inf;
    auto out = image::fill_missing(m);
    REQUIRE(out(0, 0) == 0.0);
    REQUIRE(out(0, 1) == std::numeric_limits<double>::max());
    REQUIRE(out(0, 2) == -std::numeric_limits<double>::max());
}

TEST_CASE("non_positive_training_constant_is_rejected") {
    auto g = make_grid(2, 2);
    REQUIRE_THROWS_AS(image::normalize_channel(g, 0.0), ValidationError);
    REQUIRE_THROWS_AS(image::normalize_channel(g, -1.0), ValidationError);
}

TEST_CASE("max_pool_halves_shape_and_takes_block_max") {
    auto g = make_grid(4, 6);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 6; ++x) {
            g.values(y, x) = static_cast<double>((y * 7 + x * 3) % 11);
        }
    }
    auto out = image::max_pool_2x2(g);
    REQUIRE(out.values.rows() == 2);
    REQUIRE(out.values.cols() == 3);
    REQUIRE(out.geometry.naxis2 == 2);
    REQUIRE(out.geometry.naxis1 == 3);

    for (int y = 0; y < 2; ++y) {
        for (int x = 0; x < 3; ++x) {
            const double expected = g.values.block(2 * y, 2 * x, 2, 2).maxCoeff();
            REQUIRE(out.values(y, x) == expected);
        }
    }
}

TEST_CASE("max_pool_default_grid_shape") {
    projection::RectGrid g;
    g.values = Matrix2Dd::Constant(180, 360, 0.25);
    auto out = image::max_pool_2x2(g);
    REQUIRE(out.values.rows() == 90);
    REQUIRE(out.values.cols() == 180);
    REQUIRE(out.values(45, 90) == 0.25);
}

TEST_CASE("max_pool_rejects_odd_or_empty_grids") {
    REQUIRE_THROWS_AS(image::max_pool_2x2(make_grid(3, 4)), UnsupportedGridShapeError);
    REQUIRE_THROWS_AS(image::max_pool_2x2(make_grid(4, 5)), UnsupportedGridShapeError);
    REQUIRE_THROWS_AS(image::max_pool_2x2(make_grid(0, 0)), UnsupportedGridShapeError);
}
