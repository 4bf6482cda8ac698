#include "gwskynet/skymap/skymap.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/utils.hpp"
#include "gwskynet/healpix/healpix.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace gwskynet::skymap {

namespace {

const char* column_name(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::DISTMU: return "DISTMU";
        case ChannelKind::DISTSIGMA: return "DISTSIGMA";
        case ChannelKind::DISTNORM: return "DISTNORM";
        default: return "PROB";
    }
}

struct ProbabilityColumn {
    const std::vector<double>* values = nullptr;
    bool is_density = false;
};

ProbabilityColumn find_probability_column(const io::FitsTable& table, bool prefer_density,
                                          const std::string& event_id) {
    auto prob = table.double_columns.find("PROB");
    auto dens = table.double_columns.find("PROBDENSITY");
    ProbabilityColumn out;
    if (prefer_density && dens != table.double_columns.end()) {
        out.values = &dens->second;
        out.is_density = true;
    } else if (prob != table.double_columns.end()) {
        out.values = &prob->second;
    } else if (dens != table.double_columns.end()) {
        out.values = &dens->second;
        out.is_density = true;
    } else {
        throw MalformedSkyMapError("no PROB or PROBDENSITY column", event_id);
    }
    return out;
}

EventMetadata read_metadata(const io::FitsHeader& header, const std::string& event_id) {
    EventMetadata meta;
    meta.event_id = event_id;

    auto distmean = header.get_number("DISTMEAN");
    if (!distmean || !std::isfinite(*distmean)) {
        throw MalformedSkyMapError("missing or non-finite DISTMEAN", event_id);
    }
    meta.distmean = *distmean;
    if (auto diststd = header.get_number("DISTSTD")) {
        meta.diststd = *diststd;
    }

    auto instrume = header.get_string("INSTRUME");
    if (!instrume) {
        throw MalformedSkyMapError("missing INSTRUME keyword", event_id);
    }
    for (const auto& name : parse_instruments(*instrume)) {
        Detector d;
        if (string_to_detector(name, d)) {
            bool seen = false;
            for (Detector e : meta.instruments) seen = seen || (e == d);
            if (!seen) meta.instruments.push_back(d);
        } else {
            meta.ignored_instruments.push_back(name);
        }
    }
    return meta;
}

void check_coordsys(const io::FitsHeader& header, const std::string& event_id) {
    auto coordsys = header.get_string("COORDSYS");
    if (!coordsys || coordsys->empty()) return;
    const std::string c = core::to_upper(*coordsys);
    if (c[0] != 'C' && c != "ICRS" && c != "EQUATORIAL") {
        throw MalformedSkyMapError("unsupported COORDSYS '" + *coordsys +
                                   "' (celestial ICRS required)", event_id);
    }
}

SphericalMap resolve_fixed(const io::FitsTable& table, PixelOrdering ordering,
                           const std::string& event_id) {
    ProbabilityColumn prob = find_probability_column(table, false, event_id);
    const std::size_t n = prob.values->size();

    for (ChannelKind kind : kDistanceChannels) {
        if (table.double_columns.at(column_name(kind)).size() != n) {
            throw MalformedSkyMapError(std::string("layer ") + column_name(kind) +
                                       " length differs from probability layer", event_id);
        }
    }

    int64_t nside = 0;
    if (!healpix::HealpixGrid::is_valid_npix(static_cast<int64_t>(n), &nside)) {
        throw MalformedSkyMapError("layer length " + std::to_string(n) +
                                   " is not a valid HEALPix pixel count", event_id);
    }
    if (auto hdr_nside = table.header.get_int("NSIDE")) {
        if (*hdr_nside != nside) {
            throw MalformedSkyMapError("NSIDE " + std::to_string(*hdr_nside) +
                                       " does not match data (" + std::to_string(nside) + ")",
                                       event_id);
        }
    }

    SphericalMap map;
    map.nside = nside;
    map.ordering = ordering;
    map.layers[ChannelKind::SKYMAP] = *prob.values;
    if (prob.is_density) {
        const double area = healpix::HealpixGrid(nside).pixel_area();
        for (double& v : map.layers[ChannelKind::SKYMAP]) v *= area;
    }
    for (ChannelKind kind : kDistanceChannels) {
        map.layers[kind] = table.double_columns.at(column_name(kind));
    }
    return map;
}

// Expands every multi-order cell over its nested descendants at the
// finest order present, capped at max_flatten_order.
SphericalMap resolve_multiorder(const io::FitsTable& table, const std::string& event_id,
                                int max_flatten_order) {
    auto uniq_it = table.int_columns.find("UNIQ");
    if (uniq_it == table.int_columns.end()) {
        throw MalformedSkyMapError("NUNIQ ordering without integer UNIQ column", event_id);
    }
    const std::vector<int64_t>& uniq = uniq_it->second;
    ProbabilityColumn prob = find_probability_column(table, true, event_id);

    const std::size_t rows = uniq.size();
    if (prob.values->size() != rows) {
        throw MalformedSkyMapError("probability layer length differs from UNIQ", event_id);
    }
    for (ChannelKind kind : kDistanceChannels) {
        if (table.double_columns.at(column_name(kind)).size() != rows) {
            throw MalformedSkyMapError(std::string("layer ") + column_name(kind) +
                                       " length differs from UNIQ", event_id);
        }
    }
    if (rows == 0) {
        throw MalformedSkyMapError("multi-order table has no rows", event_id);
    }

    std::vector<int> orders(rows);
    std::vector<int64_t> ipix(rows);
    int max_order = 0;
    for (std::size_t i = 0; i < rows; ++i) {
        if (!healpix::uniq_to_order_ipix(uniq[i], orders[i], ipix[i])) {
            throw MalformedSkyMapError("invalid UNIQ value " + std::to_string(uniq[i]), event_id);
        }
        max_order = std::max(max_order, orders[i]);
    }
    const int order = std::min(max_order, max_flatten_order);

    healpix::HealpixGrid grid(healpix::nside_for_order(order));
    const double flat_area = grid.pixel_area();
    const std::size_t npix = static_cast<std::size_t>(grid.npix());
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SphericalMap map;
    map.nside = grid.nside();
    map.ordering = PixelOrdering::NESTED;
    for (ChannelKind kind : kAllChannels) {
        map.layers[kind].assign(npix, nan);
    }
    std::vector<bool> covered(npix, false);

    // Cells finer than the flattening order are merged into their parent:
    // probability is summed, distance layers are averaged over the area.
    const bool coarsen = max_order > order;
    std::vector<double> fraction;
    std::vector<double> mass;
    ChannelArray<std::vector<double>> weighted;
    if (coarsen) {
        fraction.assign(npix, 0.0);
        mass.assign(npix, 0.0);
        for (ChannelKind kind : kDistanceChannels) {
            weighted[kind].assign(npix, 0.0);
        }
    }

    for (std::size_t i = 0; i < rows; ++i) {
        double prob_value = (*prob.values)[i];

        if (orders[i] > order) {
            const int shift = 2 * (orders[i] - order);
            const std::size_t idx = static_cast<std::size_t>(ipix[i] >> shift);
            const double share = 1.0 / static_cast<double>(int64_t(1) << shift);
            if (covered[idx] || fraction[idx] + share > 1.0 + 1e-9) {
                throw MalformedSkyMapError("overlapping multi-order cells at UNIQ " +
                                           std::to_string(uniq[i]), event_id);
            }
            fraction[idx] += share;
            mass[idx] += prob.is_density ? prob_value * flat_area * share : prob_value;
            for (ChannelKind kind : kDistanceChannels) {
                weighted[kind][idx] += share * table.double_columns.at(column_name(kind))[i];
            }
            continue;
        }

        const int shift = 2 * (order - orders[i]);
        const int64_t first = ipix[i] << shift;
        const int64_t count = int64_t(1) << shift;

        if (prob.is_density) {
            prob_value *= flat_area;
        } else {
            // per-cell probability spread evenly over its descendants
            prob_value /= static_cast<double>(count);
        }

        for (int64_t p = first; p < first + count; ++p) {
            const std::size_t idx = static_cast<std::size_t>(p);
            if (covered[idx] || (coarsen && fraction[idx] > 0.0)) {
                throw MalformedSkyMapError("overlapping multi-order cells at UNIQ " +
                                           std::to_string(uniq[i]), event_id);
            }
            covered[idx] = true;
            map.layers[ChannelKind::SKYMAP][idx] = prob_value;
            for (ChannelKind kind : kDistanceChannels) {
                map.layers[kind][idx] = table.double_columns.at(column_name(kind))[i];
            }
        }
    }

    for (std::size_t idx = 0; coarsen && idx < npix; ++idx) {
        if (fraction[idx] <= 0.0) continue;
        map.layers[ChannelKind::SKYMAP][idx] = mass[idx];
        for (ChannelKind kind : kDistanceChannels) {
            map.layers[kind][idx] = weighted[kind][idx] / fraction[idx];
        }
    }
    return map;
}

} // namespace

std::vector<std::string> parse_instruments(const std::string& text) {
    std::vector<std::string> out;
    for (const auto& part : core::split(text, ',')) {
        std::string name = core::trim(part);
        if (!name.empty()) out.push_back(name);
    }
    return out;
}

SkyMap resolve_skymap(const io::FitsTable& table, const std::string& fallback_event_id,
                      int max_flatten_order) {
    std::string event_id = fallback_event_id;
    if (auto object = table.header.get_string("OBJECT")) {
        if (!core::trim(*object).empty()) event_id = core::trim(*object);
    }

    int distance_columns = 0;
    for (ChannelKind kind : kDistanceChannels) {
        if (table.double_columns.count(column_name(kind))) ++distance_columns;
    }
    if (distance_columns == 0) {
        throw MissingDistanceDataError("no DISTMU/DISTSIGMA/DISTNORM columns (2-D localization)",
                                       event_id);
    }
    if (distance_columns != 3) {
        throw MalformedSkyMapError("incomplete distance layers", event_id);
    }

    check_coordsys(table.header, event_id);

    std::string ordering = core::to_upper(core::trim(table.header.get_string("ORDERING").value_or("")));
    if (ordering.empty() && table.int_columns.count("UNIQ")) {
        ordering = "NUNIQ";
    }
    if (auto indxschm = table.header.get_string("INDXSCHM")) {
        if (core::to_upper(core::trim(*indxschm)) == "EXPLICIT" && ordering != "NUNIQ") {
            throw MalformedSkyMapError("explicit (partial-sky) indexing is not supported", event_id);
        }
    }

    SkyMap out;
    if (ordering == "NUNIQ") {
        out.map = resolve_multiorder(table, event_id, max_flatten_order);
    } else if (ordering == "NESTED") {
        out.map = resolve_fixed(table, PixelOrdering::NESTED, event_id);
    } else if (ordering == "RING") {
        out.map = resolve_fixed(table, PixelOrdering::RING, event_id);
    } else {
        throw MalformedSkyMapError("unknown ORDERING '" + ordering + "'", event_id);
    }

    out.metadata = read_metadata(table.header, event_id);
    out.metadata.ordering = out.map.ordering;
    out.metadata.multiorder_source = (ordering == "NUNIQ");
    return out;
}

SkyMap read_skymap(const fs::path& path) {
    io::FitsTable table = io::read_fits_table(path);
    std::string stem = path.filename().string();
    auto dot = stem.find('.');
    if (dot != std::string::npos) stem = stem.substr(0, dot);

    SkyMap out = resolve_skymap(table, stem);
    out.metadata.source_path = path.string();
    return out;
}

io::FitsTable make_skymap_table(const SkyMap& skymap) {
    io::FitsTable table;
    table.double_columns["PROB"] = skymap.map.layers[ChannelKind::SKYMAP];
    for (ChannelKind kind : kDistanceChannels) {
        table.double_columns[column_name(kind)] = skymap.map.layers[kind];
    }

    std::vector<std::string> names;
    for (Detector d : skymap.metadata.instruments) names.push_back(detector_to_string(d));

    auto& h = table.header;
    h.set("PIXTYPE", "HEALPIX");
    h.set("ORDERING", pixel_ordering_to_string(skymap.map.ordering));
    h.set("COORDSYS", "C");
    h.set("NSIDE", static_cast<int>(skymap.map.nside));
    h.set("INDXSCHM", "IMPLICIT");
    h.set("OBJECT", skymap.metadata.event_id);
    h.set("DISTMEAN", skymap.metadata.distmean);
    if (skymap.metadata.diststd) h.set("DISTSTD", *skymap.metadata.diststd);
    h.set("INSTRUME", core::join(names, ","));
    return table;
}

void write_skymap(const fs::path& path, const SkyMap& skymap) {
    io::write_fits_table(path, make_skymap_table(skymap), "SKYMAP");
}

} // namespace gwskynet::skymap
