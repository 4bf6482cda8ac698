#include "gwskynet/model/classifier.hpp"
#include "gwskynet/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace gwskynet;

TEST_CASE("decision_threshold_is_inclusive") {
    REQUIRE(model::decide(0.5, 0.5) == model::Label::ASTROPHYSICAL);
    REQUIRE(model::decide(0.4999999, 0.5) == model::Label::NOISE);
    REQUIRE(model::decide(1.0, 1.0) == model::Label::ASTROPHYSICAL);
    REQUIRE(model::decide(0.0, 0.0) == model::Label::ASTROPHYSICAL);
    REQUIRE(model::decide(0.9, 0.95) == model::Label::NOISE);
}

TEST_CASE("nan_probability_is_an_error") {
    REQUIRE_THROWS_AS(model::decide(std::numeric_limits<double>::quiet_NaN(), 0.5),
                      ClassificationError);
}

TEST_CASE("label_names") {
    REQUIRE(model::label_to_string(model::Label::ASTROPHYSICAL) == "astrophysical");
    REQUIRE(model::label_to_string(model::Label::NOISE) == "noise/terrestrial");
}
