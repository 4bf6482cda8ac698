#pragma once

#include "gwskynet/config/configuration.hpp"
#include "gwskynet/core/types.hpp"
#include "gwskynet/image/normalization.hpp"
#include "gwskynet/skymap/skymap.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gwskynet::model {

// Dense row-major float tensor.
struct Tensor {
    std::vector<int> shape;
    std::vector<float> data;

    std::size_t element_count() const;
    std::size_t offset(const std::vector<int>& index) const;
    float at(const std::vector<int>& index) const { return data[offset(index)]; }
};

constexpr std::size_t kClassifierInputCount = 8;

// The eight classifier inputs in model order. Every tensor carries a
// leading batch dimension of 1.
struct ClassifierInput {
    Tensor volume;          // (1, H, W, 3): distmu, distsigma, distnorm
    Tensor skymap;          // (1, H, W, 1)
    Tensor detectors;       // (1, 3): H1, L1, V1
    Tensor distance;        // (1, 1)
    Tensor skymap_norm;     // (1, 1)
    Tensor distmu_norm;     // (1, 1)
    Tensor distsigma_norm;  // (1, 1)
    Tensor distnorm_norm;   // (1, 1)

    std::array<const Tensor*, kClassifierInputCount> ordered() const;
};

std::array<float, kDetectorCount> encode_detectors(const std::vector<Detector>& instruments);

ClassifierInput assemble_input(const ChannelArray<image::NormalizedChannel>& channels,
                               const skymap::EventMetadata& metadata,
                               const config::ModelContractConfig& contract);

nlohmann::json to_json(const Tensor& tensor);
nlohmann::json to_json(const ClassifierInput& input,
                       const std::vector<std::string>& input_names);

} // namespace gwskynet::model
