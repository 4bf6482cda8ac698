#include "gwskynet/model/tensor_assembler.hpp"
#include "gwskynet/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace gwskynet;

namespace {

ChannelArray<image::NormalizedChannel> constant_channels(int rows, int cols) {
    ChannelArray<image::NormalizedChannel> channels;
    for (ChannelKind kind : kAllChannels) {
        channels[kind].grid.values =
            Matrix2Dd::Constant(rows, cols, static_cast<double>(channel_index(kind)));
        channels[kind].norm = 0.1 * static_cast<double>(channel_index(kind) + 1);
    }
    return channels;
}

} // namespace

TEST_CASE("detector_encoding_is_multi_hot") {
    auto hl = model::encode_detectors({Detector::H1, Detector::L1});
    REQUIRE(hl[0] == 1.0f);
    REQUIRE(hl[1] == 1.0f);
    REQUIRE(hl[2] == 0.0f);

    auto none = model::encode_detectors({});
    REQUIRE(none[0] == 0.0f);
    REQUIRE(none[1] == 0.0f);
    REQUIRE(none[2] == 0.0f);

    auto v = model::encode_detectors({Detector::V1, Detector::V1});
    REQUIRE(v[2] == 1.0f);
    REQUIRE(v[0] == 0.0f);
}

TEST_CASE("assembled_tensors_have_model_shapes") {
    config::ModelContractConfig contract;
    skymap::EventMetadata meta;
    meta.distmean = 5160.0;
    meta.instruments = {Detector::H1, Detector::V1};

    auto in = model::assemble_input(constant_channels(90, 180), meta, contract);

    REQUIRE(in.volume.shape == std::vector<int>{1, 90, 180, 3});
    REQUIRE(in.skymap.shape == std::vector<int>{1, 90, 180, 1});
    REQUIRE(in.detectors.shape == std::vector<int>{1, 3});
    REQUIRE(in.distance.shape == std::vector<int>{1, 1});
    REQUIRE(in.distnorm_norm.shape == std::vector<int>{1, 1});
    REQUIRE(in.volume.data.size() == in.volume.element_count());

    REQUIRE(in.distance.data[0] == Catch::Approx(0.5f));
    REQUIRE(in.detectors.data == std::vector<float>{1.0f, 0.0f, 1.0f});
    REQUIRE(in.skymap_norm.data[0] == Catch::Approx(0.1f));
    REQUIRE(in.distmu_norm.data[0] == Catch::Approx(0.2f));
    REQUIRE(in.distsigma_norm.data[0] == Catch::Approx(0.3f));
    REQUIRE(in.distnorm_norm.data[0] == Catch::Approx(0.4f));
}

TEST_CASE("volume_channels_are_distmu_distsigma_distnorm") {
    config::ModelContractConfig contract;
    skymap::EventMetadata meta;
    meta.distmean = 100.0;

    auto channels = constant_channels(90, 180);
    channels[ChannelKind::SKYMAP].grid.values(10, 20) = 9.0;
    auto in = model::assemble_input(channels, meta, contract);

    REQUIRE(in.volume.at({0, 10, 20, 0}) == 1.0f);
    REQUIRE(in.volume.at({0, 10, 20, 1}) == 2.0f);
    REQUIRE(in.volume.at({0, 10, 20, 2}) == 3.0f);
    REQUIRE(in.skymap.at({0, 10, 20, 0}) == 9.0f);
    REQUIRE(in.skymap.at({0, 10, 21, 0}) == 0.0f);
}

TEST_CASE("ordered_inputs_follow_model_order") {
    config::ModelContractConfig contract;
    skymap::EventMetadata meta;
    meta.distmean = 1.0;
    auto in = model::assemble_input(constant_channels(90, 180), meta, contract);
    auto ordered = in.ordered();
    REQUIRE(ordered[0] == &in.volume);
    REQUIRE(ordered[1] == &in.skymap);
    REQUIRE(ordered[2] == &in.detectors);
    REQUIRE(ordered[3] == &in.distance);
    REQUIRE(ordered[7] == &in.distnorm_norm);

    auto doc = model::to_json(in, config::ClassifierConfig{}.input_names);
    REQUIRE(doc.size() == 8);
    REQUIRE(doc[0]["name"].get<std::string>() == "volume");
    REQUIRE(doc[3]["data"][0].get<float>() == Catch::Approx(1.0f / 10320.0f));
}

TEST_CASE("wrong_channel_shape_is_rejected") {
    config::ModelContractConfig contract;
    skymap::EventMetadata meta;
    REQUIRE_THROWS_AS(model::assemble_input(constant_channels(180, 360), meta, contract),
                      UnsupportedGridShapeError);
}

TEST_CASE("tensor_index_out_of_range_throws") {
    model::Tensor t;
    t.shape = {1, 2};
    t.data = {1.0f, 2.0f};
    REQUIRE(t.at({0, 1}) == 2.0f);
    REQUIRE_THROWS_AS(t.at({0, 2}), ValidationError);
    REQUIRE_THROWS_AS(t.at({0}), ValidationError);
}
