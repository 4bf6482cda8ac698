#include "gwskynet/model/tensor_assembler.hpp"
#include "gwskynet/core/errors.hpp"

#include <string>

namespace gwskynet::model {

namespace {

Tensor scalar_tensor(double value) {
    Tensor t;
    t.shape = {1, 1};
    t.data = {static_cast<float>(value)};
    return t;
}

std::string shape_string(const Matrix2Dd& m) {
    return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

} // namespace

std::size_t Tensor::element_count() const {
    std::size_t n = 1;
    for (int d : shape) n *= static_cast<std::size_t>(d);
    return n;
}

std::size_t Tensor::offset(const std::vector<int>& index) const {
    if (index.size() != shape.size()) {
        throw ValidationError("tensor index rank mismatch");
    }
    std::size_t off = 0;
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (index[i] < 0 || index[i] >= shape[i]) {
            throw ValidationError("tensor index out of range");
        }
        off = off * static_cast<std::size_t>(shape[i]) + static_cast<std::size_t>(index[i]);
    }
    return off;
}

std::array<const Tensor*, kClassifierInputCount> ClassifierInput::ordered() const {
    return {&volume, &skymap, &detectors, &distance,
            &skymap_norm, &distmu_norm, &distsigma_norm, &distnorm_norm};
}

std::array<float, kDetectorCount> encode_detectors(const std::vector<Detector>& instruments) {
    std::array<float, kDetectorCount> out{0.0f, 0.0f, 0.0f};
    for (Detector d : instruments) {
        out[static_cast<std::size_t>(d)] = 1.0f;
    }
    return out;
}

ClassifierInput assemble_input(const ChannelArray<image::NormalizedChannel>& channels,
                               const skymap::EventMetadata& metadata,
                               const config::ModelContractConfig& contract) {
    const projection::CarGeometry expected = contract.grid.pooled_2x2();
    for (ChannelKind kind : kAllChannels) {
        const Matrix2Dd& v = channels[kind].grid.values;
        if (v.rows() != expected.naxis2 || v.cols() != expected.naxis1) {
            throw UnsupportedGridShapeError(
                channel_to_string(kind) + " grid is " + shape_string(v) + ", expected " +
                std::to_string(expected.naxis2) + "x" + std::to_string(expected.naxis1));
        }
    }

    const int h = expected.naxis2;
    const int w = expected.naxis1;
    const std::size_t plane = static_cast<std::size_t>(h) * static_cast<std::size_t>(w);

    ClassifierInput in;

    in.volume.shape = {1, h, w, static_cast<int>(kDistanceChannels.size())};
    in.volume.data.resize(plane * kDistanceChannels.size());
    for (std::size_t c = 0; c < kDistanceChannels.size(); ++c) {
        const Matrix2Dd& src = channels[kDistanceChannels[c]].grid.values;
        for (int y = 0; y < h; ++y) {
            for (int x = 0; x < w; ++x) {
                const std::size_t pix = static_cast<std::size_t>(y) * w + x;
                in.volume.data[pix * kDistanceChannels.size() + c] = static_cast<float>(src(y, x));
            }
        }
    }

    in.skymap.shape = {1, h, w, 1};
    in.skymap.data.resize(plane);
    const Matrix2Dd& sky = channels[ChannelKind::SKYMAP].grid.values;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            in.skymap.data[static_cast<std::size_t>(y) * w + x] = static_cast<float>(sky(y, x));
        }
    }

    auto det = encode_detectors(metadata.instruments);
    in.detectors.shape = {1, static_cast<int>(kDetectorCount)};
    in.detectors.data.assign(det.begin(), det.end());

    in.distance = scalar_tensor(metadata.distmean / contract.distance_norm);
    in.skymap_norm = scalar_tensor(channels[ChannelKind::SKYMAP].norm);
    in.distmu_norm = scalar_tensor(channels[ChannelKind::DISTMU].norm);
    in.distsigma_norm = scalar_tensor(channels[ChannelKind::DISTSIGMA].norm);
    in.distnorm_norm = scalar_tensor(channels[ChannelKind::DISTNORM].norm);
    return in;
}

nlohmann::json to_json(const Tensor& tensor) {
    return {{"shape", tensor.shape}, {"data", tensor.data}};
}

nlohmann::json to_json(const ClassifierInput& input,
                       const std::vector<std::string>& input_names) {
    if (input_names.size() != kClassifierInputCount) {
        throw ValidationError("expected 8 classifier input names");
    }
    nlohmann::json out = nlohmann::json::array();
    auto tensors = input.ordered();
    for (std::size_t i = 0; i < kClassifierInputCount; ++i) {
        nlohmann::json entry = to_json(*tensors[i]);
        entry["name"] = input_names[i];
        out.push_back(entry);
    }
    return out;
}

} // namespace gwskynet::model
