#include "planform/image/processing.hpp"
#include "planform/core/errors.hpp"
#include "planform/core/types.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using planform::Matrix2Dd;
namespace image = planform::image;

TEST_CASE("linspace_includes_both_end_points") {
    auto v = image::linspace(-2.0, 2.0, 5);
    REQUIRE(v.size() == 5);
    REQUIRE(v[0] == -2.0);
    REQUIRE(v[2] == Catch::Approx(0.0).margin(1e-15));
    REQUIRE(v[4] == 2.0);

    auto one = image::linspace(-0.5, 0.5, 1);
    REQUIRE(one.size() == 1);
    REQUIRE(one[0] == 0.0);

    REQUIRE(image::linspace(0.0, 1.0, 0).size() == 0);
}

TEST_CASE("meshgrid_pairs_columns_with_x_and_rows_with_y") {
    planform::VectorXd xs(3);
    xs << 10.0, 20.0, 30.0;
    planform::VectorXd ys(2);
    ys << -1.0, 1.0;

    auto [X, Y] = image::meshgrid(xs, ys);
    REQUIRE(X.rows() == 2);
    REQUIRE(X.cols() == 3);
    REQUIRE(X(1, 2) == 30.0);
    REQUIRE(Y(1, 2) == 1.0);
    REQUIRE(Y(0, 0) == -1.0);
}

TEST_CASE("to_gray_levels_maps_unit_range_onto_gray_scale") {
    Matrix2Dd img(1, 3);
    img << -1.0, 0.0, 1.0;
    Matrix2Dd out = image::to_gray_levels(img, 255.0);
    REQUIRE(out(0, 0) == 0.0);
    REQUIRE(out(0, 1) == 127.5);
    REQUIRE(out(0, 2) == 255.0);
}

TEST_CASE("masked_gray_attenuates_toward_mid_gray") {
    Matrix2Dd img = Matrix2Dd::Constant(2, 2, 1.0);
    Matrix2Dd mask(2, 2);
    mask << 1.0, 0.5,
            0.25, 0.0;
    Matrix2Dd out = image::masked_gray(img, mask, 100.0);
    REQUIRE(out(0, 0) == Catch::Approx(100.0));
    REQUIRE(out(0, 1) == Catch::Approx(75.0));
    REQUIRE(out(1, 0) == Catch::Approx(62.5));
    REQUIRE(out(1, 1) == Catch::Approx(50.0));
}

TEST_CASE("apply_mask_rejects_shape_mismatch") {
    Matrix2Dd img = Matrix2Dd::Zero(2, 2);
    Matrix2Dd mask = Matrix2Dd::Ones(3, 3);
    REQUIRE_THROWS_AS(image::apply_mask(img, mask), planform::ValidationError);
}

TEST_CASE("mean_of_averages_elementwise") {
    Matrix2Dd a(1, 2);
    Matrix2Dd b(1, 2);
    Matrix2Dd c(1, 2);
    a << 1.0, 2.0;
    b << 3.0, 4.0;
    c << 5.0, 9.0;
    Matrix2Dd m = image::mean_of({&a, &b, &c});
    REQUIRE(m(0, 0) == Catch::Approx(3.0));
    REQUIRE(m(0, 1) == Catch::Approx(5.0));
    REQUIRE(image::mean_of({}).size() == 0);
}

TEST_CASE("image_stats_reports_min_max_mean_and_sample_stddev") {
    Matrix2Dd img(2, 2);
    img << 1.0, 2.0,
           3.0, 4.0;
    auto s = image::image_stats(img);
    REQUIRE(s.min == 1.0);
    REQUIRE(s.max == 4.0);
    REQUIRE(s.mean == Catch::Approx(2.5));
    REQUIRE(s.stddev == Catch::Approx(std::sqrt(5.0 / 3.0)));

    auto empty = image::image_stats(Matrix2Dd());
    REQUIRE(empty.mean == 0.0);
}
