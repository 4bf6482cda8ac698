#include "gwskynet/pipeline/pipeline.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/io/fits_io.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <limits>
#include <sstream>

using namespace gwskynet;
namespace fs = std::filesystem;

namespace {

class FixedClassifier : public model::Classifier {
public:
    explicit FixedClassifier(double p) : p_(p) {}

    double predict(const model::ClassifierInput& input) const override {
        calls++;
        last_distance = input.distance.data.at(0);
        return p_;
    }
    std::string name() const override { return "fixed"; }

    mutable std::atomic<int> calls{0};
    mutable float last_distance = 0.0f;

private:
    double p_;
};

// Uniform probability, every distance value at its invalid sentinel.
skymap::SkyMap sentinel_skymap() {
    const std::size_t npix = 12 * 8 * 8;
    skymap::SkyMap sm;
    sm.map.nside = 8;
    sm.map.ordering = PixelOrdering::NESTED;
    sm.map.layers[ChannelKind::SKYMAP].assign(npix, 1.0);
    sm.map.layers[ChannelKind::DISTMU].assign(npix, std::numeric_limits<double>::infinity());
    sm.map.layers[ChannelKind::DISTSIGMA].assign(npix, 1.0);
    sm.map.layers[ChannelKind::DISTNORM].assign(npix, 0.0);
    sm.metadata.event_id = "S000000a";
    sm.metadata.distmean = 10320.0;
    sm.metadata.instruments = {Detector::H1, Detector::L1, Detector::V1};
    return sm;
}

} // namespace

TEST_CASE("sentinel_record_prepares_to_reference_inputs") {
    auto classifier = std::make_shared<FixedClassifier>(0.5);
    pipeline::Pipeline pipe(config::Config{}, classifier);

    auto prepared = pipe.prepare(sentinel_skymap());
    const auto& in = prepared.input;

    REQUIRE(in.distance.data[0] == Catch::Approx(1.0f));
    REQUIRE(in.detectors.data == std::vector<float>{1.0f, 1.0f, 1.0f});

    for (float v : in.volume.data) {
        REQUIRE(v == 0.0f);
    }
    for (float v : in.skymap.data) {
        REQUIRE(v == Catch::Approx(1.0f).epsilon(1e-6));
    }
    REQUIRE(in.distmu_norm.data[0] == 0.0f);
    REQUIRE(in.distsigma_norm.data[0] == 0.0f);
    REQUIRE(in.distnorm_norm.data[0] == 0.0f);
    REQUIRE(in.skymap_norm.data[0] ==
            Catch::Approx(1.0 / config::ModelContractConfig{}.skymap_norm).epsilon(1e-6));

    REQUIRE(prepared.reprojected[ChannelKind::SKYMAP].values.rows() == 180);
    REQUIRE(prepared.channels[ChannelKind::SKYMAP].grid.values.cols() == 180);
    REQUIRE(classifier->calls.load() == 0);
}

TEST_CASE("threshold_boundary_is_astrophysical") {
    auto classifier = std::make_shared<FixedClassifier>(0.5);
    pipeline::Pipeline pipe(config::Config{}, classifier);

    auto prediction = pipe.classify(sentinel_skymap());
    REQUIRE(prediction.event_id == "S000000a");
    REQUIRE(prediction.probability == 0.5);
    REQUIRE(prediction.threshold == 0.5);
    REQUIRE(prediction.label == model::Label::ASTROPHYSICAL);
    REQUIRE(classifier->calls.load() == 1);
    REQUIRE(classifier->last_distance == Catch::Approx(1.0f));
}

TEST_CASE("threshold_comes_from_config") {
    config::Config cfg;
    cfg.decision.threshold = 0.8;
    pipeline::Pipeline pipe(cfg, std::make_shared<FixedClassifier>(0.75));
    auto prediction = pipe.classify(sentinel_skymap());
    REQUIRE(prediction.label == model::Label::NOISE);
    REQUIRE(prediction.threshold == 0.8);
}

TEST_CASE("pipeline_requires_a_classifier") {
    REQUIRE_THROWS_AS(pipeline::Pipeline(config::Config{}, nullptr), ModelUnavailableError);
}

TEST_CASE("pipeline_rejects_invalid_config") {
    config::Config cfg;
    cfg.model_contract.distance_norm = -1.0;
    REQUIRE_THROWS_AS(pipeline::Pipeline(cfg, std::make_shared<FixedClassifier>(0.1)),
                      ValidationError);
}

TEST_CASE("two_dimensional_file_stops_before_classifier") {
    fs::path dir = fs::temp_directory_path() / "gwskynet_tests";
    fs::create_directories(dir);
    fs::path path = dir / "S2Donly.fits";
    fs::remove(path);

    io::FitsTable t;
    t.double_columns["PROB"].assign(48, 1.0 / 48.0);
    t.header.set("ORDERING", "NESTED");
    t.header.set("OBJECT", "S2Donly");
    t.header.set("DISTMEAN", 100.0);
    t.header.set("INSTRUME", "H1,L1");
    io::write_fits_table(path, t, "SKYMAP");

    auto classifier = std::make_shared<FixedClassifier>(0.9);
    pipeline::Pipeline pipe(config::Config{}, classifier);
    try {
        pipe.classify_file(path);
        FAIL("expected MissingDistanceDataError");
    } catch (const MissingDistanceDataError& e) {
        REQUIRE(e.event_id() == "S2Donly");
        REQUIRE(std::string(e.what()).find("S2Donly") != std::string::npos);
    }
    REQUIRE(classifier->calls.load() == 0);
}

TEST_CASE("event_errors_are_tagged_with_event_id") {
    auto sm = sentinel_skymap();
    sm.map.layers[ChannelKind::DISTNORM].pop_back();
    pipeline::Pipeline pipe(config::Config{}, std::make_shared<FixedClassifier>(0.1));
    try {
        pipe.prepare(sm);
        FAIL("expected MalformedSkyMapError");
    } catch (const MalformedSkyMapError& e) {
        REQUIRE(e.event_id() == "S000000a");
    }
}

TEST_CASE("classifier_failures_carry_event_id") {
    pipeline::Pipeline pipe(config::Config{},
                            std::make_shared<FixedClassifier>(
                                std::numeric_limits<double>::quiet_NaN()));
    try {
        pipe.classify(sentinel_skymap());
        FAIL("expected ClassificationError");
    } catch (const ClassificationError& e) {
        REQUIRE(e.event_id() == "S000000a");
        REQUIRE(std::string(e.what()).find("S000000a") != std::string::npos);
        REQUIRE(std::string(e.what()).find("NaN") != std::string::npos);
    }
}

TEST_CASE("out_of_range_probability_is_rejected_for_any_classifier") {
    for (double p : {1.3, -0.01}) {
        pipeline::Pipeline pipe(config::Config{}, std::make_shared<FixedClassifier>(p));
        try {
            pipe.classify(sentinel_skymap());
            FAIL("expected ClassificationError");
        } catch (const ClassificationError& e) {
            REQUIRE(e.event_id() == "S000000a");
            REQUIRE(std::string(e.what()).find("outside [0,1]") != std::string::npos);
        }
    }
    pipeline::Pipeline pipe(config::Config{}, std::make_shared<FixedClassifier>(1.0));
    REQUIRE(pipe.classify(sentinel_skymap()).label == model::Label::ASTROPHYSICAL);
}

TEST_CASE("pipeline_errors_from_classifier_are_wrapped_with_event_id") {
    class ThrowingClassifier : public model::Classifier {
    public:
        double predict(const model::ClassifierInput&) const override {
            throw PipelineError("backend unavailable");
        }
        std::string name() const override { return "throwing"; }
    };

    pipeline::Pipeline pipe(config::Config{}, std::make_shared<ThrowingClassifier>());
    try {
        pipe.classify(sentinel_skymap());
        FAIL("expected ClassificationError");
    } catch (const ClassificationError& e) {
        REQUIRE(e.event_id() == "S000000a");
        REQUIRE(std::string(e.what()).find("backend unavailable") != std::string::npos);
    }
}

TEST_CASE("contract_grid_sets_input_shape") {
    config::Config cfg;
    cfg.model_contract.grid.naxis1 = 10;
    cfg.model_contract.grid.naxis2 = 6;
    pipeline::Pipeline pipe(cfg, std::make_shared<FixedClassifier>(0.1));

    auto prepared = pipe.prepare(sentinel_skymap());
    REQUIRE(prepared.input.skymap.shape == std::vector<int>{1, 3, 5, 1});
}

TEST_CASE("stage_events_are_emitted_as_json_lines") {
    core::EventEmitter emitter;
    std::ostringstream log;
    pipeline::Pipeline pipe(config::Config{}, std::make_shared<FixedClassifier>(0.2));
    pipe.set_event_sink(&emitter, &log, "run-1");
    pipe.classify(sentinel_skymap());

    std::istringstream lines(log.str());
    std::string line;
    int stage_starts = 0;
    bool classified = false;
    while (std::getline(lines, line)) {
        auto ev = nlohmann::json::parse(line);
        REQUIRE(ev["run_id"].get<std::string>() == "run-1");
        REQUIRE(ev.contains("ts"));
        if (ev["type"] == "stage_start") ++stage_starts;
        if (ev["type"] == "event_classified") {
            classified = true;
            REQUIRE(ev["label"].get<std::string>() == "noise/terrestrial");
            REQUIRE(ev["event_id"].get<std::string>() == "S000000a");
        }
    }
    REQUIRE(stage_starts == 6);
    REQUIRE(classified);
}
