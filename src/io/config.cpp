#include "gwskynet/config/configuration.hpp"
#include "gwskynet/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace gwskynet::config {

static bool is_even(int v) {
    return (v % 2) == 0;
}

static void read_grid(const YAML::Node& g, projection::CarGeometry& out) {
    if (g["naxis1"]) out.naxis1 = g["naxis1"].as<int>();
    if (g["naxis2"]) out.naxis2 = g["naxis2"].as<int>();
    if (g["crpix1"]) out.crpix1 = g["crpix1"].as<double>();
    if (g["crpix2"]) out.crpix2 = g["crpix2"].as<double>();
    if (g["crval1"]) out.crval1 = g["crval1"].as<double>();
    if (g["crval2"]) out.crval2 = g["crval2"].as<double>();
    if (g["cdelt1"]) out.cdelt1 = g["cdelt1"].as<double>();
    if (g["cdelt2"]) out.cdelt2 = g["cdelt2"].as<double>();
}

double ModelContractConfig::channel_norm(ChannelKind kind) const {
    switch (kind) {
        case ChannelKind::SKYMAP: return skymap_norm;
        case ChannelKind::DISTMU: return distmu_norm;
        case ChannelKind::DISTSIGMA: return distsigma_norm;
        case ChannelKind::DISTNORM: return distnorm_norm;
        default: break;
    }
    throw ValidationError("unknown channel kind");
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["model_contract"]) {
            auto m = node["model_contract"];
            if (m["version"]) cfg.model_contract.version = m["version"].as<std::string>();
            if (m["skymap_norm"]) cfg.model_contract.skymap_norm = m["skymap_norm"].as<double>();
            if (m["distmu_norm"]) cfg.model_contract.distmu_norm = m["distmu_norm"].as<double>();
            if (m["distsigma_norm"]) cfg.model_contract.distsigma_norm = m["distsigma_norm"].as<double>();
            if (m["distnorm_norm"]) cfg.model_contract.distnorm_norm = m["distnorm_norm"].as<double>();
            if (m["distance_norm"]) cfg.model_contract.distance_norm = m["distance_norm"].as<double>();
            if (m["grid"]) read_grid(m["grid"], cfg.model_contract.grid);
        }

        if (node["classifier"]) {
            auto c = node["classifier"];
            if (c["model_path"]) cfg.classifier.model_path = c["model_path"].as<std::string>();
            if (c["model_sha256"]) cfg.classifier.model_sha256 = c["model_sha256"].as<std::string>();
            if (c["output_name"]) cfg.classifier.output_name = c["output_name"].as<std::string>();
            if (c["input_names"] && c["input_names"].IsSequence()) {
                cfg.classifier.input_names.clear();
                for (const auto& it : c["input_names"]) {
                    cfg.classifier.input_names.push_back(it.as<std::string>());
                }
            }
        }

        if (node["decision"]) {
            auto d = node["decision"];
            if (d["threshold"]) cfg.decision.threshold = d["threshold"].as<double>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["artifacts_dir"]) cfg.output.artifacts_dir = o["artifacts_dir"].as<std::string>();
            if (o["write_channel_images"]) cfg.output.write_channel_images = o["write_channel_images"].as<bool>();
            if (o["write_input_json"]) cfg.output.write_input_json = o["write_input_json"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_events"]) cfg.runtime.parallel_events = r["parallel_events"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["model_contract"]["version"] = model_contract.version;
    node["model_contract"]["skymap_norm"] = model_contract.skymap_norm;
    node["model_contract"]["distmu_norm"] = model_contract.distmu_norm;
    node["model_contract"]["distsigma_norm"] = model_contract.distsigma_norm;
    node["model_contract"]["distnorm_norm"] = model_contract.distnorm_norm;
    node["model_contract"]["distance_norm"] = model_contract.distance_norm;
    node["model_contract"]["grid"]["naxis1"] = model_contract.grid.naxis1;
    node["model_contract"]["grid"]["naxis2"] = model_contract.grid.naxis2;
    node["model_contract"]["grid"]["crpix1"] = model_contract.grid.crpix1;
    node["model_contract"]["grid"]["crpix2"] = model_contract.grid.crpix2;
    node["model_contract"]["grid"]["crval1"] = model_contract.grid.crval1;
    node["model_contract"]["grid"]["crval2"] = model_contract.grid.crval2;
    node["model_contract"]["grid"]["cdelt1"] = model_contract.grid.cdelt1;
    node["model_contract"]["grid"]["cdelt2"] = model_contract.grid.cdelt2;

    node["classifier"]["model_path"] = classifier.model_path;
    node["classifier"]["model_sha256"] = classifier.model_sha256;
    node["classifier"]["output_name"] = classifier.output_name;
    for (const auto& name : classifier.input_names) {
        node["classifier"]["input_names"].push_back(name);
    }

    node["decision"]["threshold"] = decision.threshold;

    node["output"]["artifacts_dir"] = output.artifacts_dir;
    node["output"]["write_channel_images"] = output.write_channel_images;
    node["output"]["write_input_json"] = output.write_input_json;

    node["runtime"]["parallel_events"] = runtime.parallel_events;

    return node;
}

void Config::validate() const {
    if (model_contract.version.empty()) {
        throw ValidationError("model_contract.version must not be empty");
    }
    for (ChannelKind kind : kAllChannels) {
        double v = model_contract.channel_norm(kind);
        if (!std::isfinite(v) || v <= 0.0) {
            throw ValidationError("model_contract." + channel_to_string(kind) +
                                  "_norm must be finite and > 0");
        }
    }
    if (!std::isfinite(model_contract.distance_norm) || model_contract.distance_norm <= 0.0) {
        throw ValidationError("model_contract.distance_norm must be finite and > 0");
    }

    const auto& g = model_contract.grid;
    if (!g.valid()) {
        throw ValidationError("model_contract.grid must have positive size and non-zero cdelt");
    }
    if (!is_even(g.naxis1) || !is_even(g.naxis2)) {
        throw ValidationError("model_contract.grid naxis1/naxis2 must be even (2x2 pooling)");
    }

    if (classifier.input_names.size() != 8) {
        throw ValidationError("classifier.input_names must list exactly 8 names");
    }
    for (const auto& name : classifier.input_names) {
        if (name.empty()) {
            throw ValidationError("classifier.input_names must not contain empty names");
        }
    }
    if (!classifier.model_sha256.empty() && classifier.model_sha256.size() != 64) {
        throw ValidationError("classifier.model_sha256 must be a 64-character hex digest");
    }

    if (!(decision.threshold >= 0.0 && decision.threshold <= 1.0)) {
        throw ValidationError("decision.threshold must be in [0,1]");
    }

    if (runtime.parallel_events < 1 || runtime.parallel_events > 64) {
        throw ValidationError("runtime.parallel_events must be in [1,64]");
    }
}

} // namespace gwskynet::config
