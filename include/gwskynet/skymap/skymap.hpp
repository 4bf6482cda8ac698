#pragma once

#include "gwskynet/core/types.hpp"
#include "gwskynet/io/fits_io.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gwskynet::skymap {

// Four layers sharing one HEALPix resolution and ordering.
struct SphericalMap {
    int64_t nside = 0;
    PixelOrdering ordering = PixelOrdering::NESTED;
    ChannelArray<std::vector<double>> layers;

    std::size_t npix() const { return layers[ChannelKind::SKYMAP].size(); }
};

struct EventMetadata {
    std::string event_id;
    double distmean = 0.0;             // Mpc
    std::optional<double> diststd;     // Mpc, informational
    std::vector<Detector> instruments; // vocabulary members only
    std::vector<std::string> ignored_instruments;
    PixelOrdering ordering = PixelOrdering::NESTED;
    bool multiorder_source = false;
    std::string source_path;
};

struct SkyMap {
    SphericalMap map;
    EventMetadata metadata;
};

// "H1,L1,V1" -> {"H1","L1","V1"}; blanks dropped.
std::vector<std::string> parse_instruments(const std::string& text);

// Finest order a multi-order map is flattened to (nside 2048). Deeper
// cells are merged into their parent at this order.
constexpr int kMaxFlattenOrder = 11;

// Builds a single-resolution map from a HEALPix table (fixed-resolution
// RING/NESTED or multi-order NUNIQ). Throws MissingDistanceDataError or
// MalformedSkyMapError.
SkyMap resolve_skymap(const io::FitsTable& table, const std::string& fallback_event_id,
                      int max_flatten_order = kMaxFlattenOrder);

SkyMap read_skymap(const fs::path& path);

// Fixed-resolution table in the layout read_skymap accepts.
io::FitsTable make_skymap_table(const SkyMap& skymap);

void write_skymap(const fs::path& path, const SkyMap& skymap);

} // namespace gwskynet::skymap
