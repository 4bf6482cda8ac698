#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gwskynet {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// The four layers of a 3-D localization, in training column order.
enum class ChannelKind {
    SKYMAP = 0,
    DISTMU = 1,
    DISTSIGMA = 2,
    DISTNORM = 3
};

constexpr std::size_t kChannelCount = 4;

constexpr std::array<ChannelKind, kChannelCount> kAllChannels = {
    ChannelKind::SKYMAP, ChannelKind::DISTMU, ChannelKind::DISTSIGMA,
    ChannelKind::DISTNORM};

constexpr std::array<ChannelKind, 3> kDistanceChannels = {
    ChannelKind::DISTMU, ChannelKind::DISTSIGMA, ChannelKind::DISTNORM};

constexpr std::size_t channel_index(ChannelKind kind) {
    return static_cast<std::size_t>(kind);
}

inline std::string channel_to_string(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::SKYMAP: return "skymap";
        case ChannelKind::DISTMU: return "distmu";
        case ChannelKind::DISTSIGMA: return "distsigma";
        case ChannelKind::DISTNORM: return "distnorm";
        default: return "unknown";
    }
}

// Fixed-size per-channel storage indexed by ChannelKind.
template <typename T>
struct ChannelArray {
    std::array<T, kChannelCount> items{};

    T& operator[](ChannelKind kind) { return items[channel_index(kind)]; }
    const T& operator[](ChannelKind kind) const { return items[channel_index(kind)]; }
};

// HEALPix pixel ordering
enum class PixelOrdering {
    NESTED,
    RING
};

inline std::string pixel_ordering_to_string(PixelOrdering ordering) {
    switch (ordering) {
        case PixelOrdering::NESTED: return "NESTED";
        case PixelOrdering::RING: return "RING";
        default: return "UNKNOWN";
    }
}

// Detector vocabulary, in multi-hot vector order.
enum class Detector {
    H1 = 0,
    L1 = 1,
    V1 = 2
};

constexpr std::size_t kDetectorCount = 3;

inline std::string detector_to_string(Detector d) {
    switch (d) {
        case Detector::H1: return "H1";
        case Detector::L1: return "L1";
        case Detector::V1: return "V1";
        default: return "UNKNOWN";
    }
}

inline bool string_to_detector(const std::string& s, Detector& out) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(), std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(), norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (norm == "H1") { out = Detector::H1; return true; }
    if (norm == "L1") { out = Detector::L1; return true; }
    if (norm == "V1") { out = Detector::V1; return true; }
    return false;
}

// Pipeline stage enumeration
enum class Stage {
    READ = 0,
    SANITIZE = 1,
    REPROJECT = 2,
    NORMALIZE = 3,
    DOWNSAMPLE = 4,
    ASSEMBLE = 5,
    CLASSIFY = 6
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::READ: return "READ";
        case Stage::SANITIZE: return "SANITIZE";
        case Stage::REPROJECT: return "REPROJECT";
        case Stage::NORMALIZE: return "NORMALIZE";
        case Stage::DOWNSAMPLE: return "DOWNSAMPLE";
        case Stage::ASSEMBLE: return "ASSEMBLE";
        case Stage::CLASSIFY: return "CLASSIFY";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace gwskynet
