#include "gwskynet/config/configuration.hpp"
#include "gwskynet/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <yaml-cpp/yaml.h>

using namespace gwskynet;

TEST_CASE("default_config_validates") {
    config::Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.decision.threshold == Catch::Approx(0.5));
    REQUIRE(cfg.model_contract.distance_norm == Catch::Approx(10320.0));
    REQUIRE(cfg.model_contract.grid.naxis1 == 360);
    REQUIRE(cfg.model_contract.grid.naxis2 == 180);
    REQUIRE(cfg.classifier.input_names.size() == 8);
}

TEST_CASE("config_yaml_round_trip_preserves_contract") {
    config::Config cfg;
    cfg.model_contract.version = "test-contract";
    cfg.model_contract.distmu_norm = 1234.5;
    cfg.decision.threshold = 0.7;
    cfg.runtime.parallel_events = 4;
    cfg.classifier.model_path = "model.onnx";

    config::Config back = config::Config::from_yaml(cfg.to_yaml());
    REQUIRE(back.model_contract.version == "test-contract");
    REQUIRE(back.model_contract.distmu_norm == Catch::Approx(1234.5));
    REQUIRE(back.decision.threshold == Catch::Approx(0.7));
    REQUIRE(back.runtime.parallel_events == 4);
    REQUIRE(back.classifier.model_path == "model.onnx");
    REQUIRE(back.classifier.input_names == cfg.classifier.input_names);
}

TEST_CASE("config_save_and_load_from_file") {
    auto path = std::filesystem::temp_directory_path() / "gwskynet_test_config.yaml";
    config::Config cfg;
    cfg.model_contract.skymap_norm = 0.5;
    cfg.save(path);

    config::Config back = config::Config::load(path);
    REQUIRE(back.model_contract.skymap_norm == Catch::Approx(0.5));
    std::filesystem::remove(path);
}

TEST_CASE("partial_yaml_keeps_defaults") {
    YAML::Node node = YAML::Load("decision:\n  threshold: 0.25\n");
    config::Config cfg = config::Config::from_yaml(node);
    REQUIRE(cfg.decision.threshold == Catch::Approx(0.25));
    REQUIRE(cfg.model_contract.distance_norm == Catch::Approx(10320.0));
}

TEST_CASE("config_validation_rejects_bad_values") {
    config::Config cfg;

    SECTION("threshold out of range") {
        cfg.decision.threshold = 1.5;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("non-positive training constant") {
        cfg.model_contract.distnorm_norm = 0.0;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("odd grid cannot be pooled") {
        cfg.model_contract.grid.naxis1 = 361;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("wrong number of input names") {
        cfg.classifier.input_names.pop_back();
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
    SECTION("worker count") {
        cfg.runtime.parallel_events = 0;
        REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
    }
}

TEST_CASE("missing_config_file_is_config_error") {
    REQUIRE_THROWS_AS(config::Config::load("/nonexistent/gwskynet.yaml"), ConfigError);
}

TEST_CASE("malformed_yaml_value_is_config_error") {
    YAML::Node node = YAML::Load("decision:\n  threshold: high\n");
    REQUIRE_THROWS_AS(config::Config::from_yaml(node), ConfigError);
}
