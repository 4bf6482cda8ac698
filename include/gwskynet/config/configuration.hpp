#pragma once

#include "gwskynet/core/types.hpp"
#include "gwskynet/projection/car_geometry.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace gwskynet::config {

namespace fs = std::filesystem;

// Constants frozen at model-training time. They are versioned together
// with the model artifact; changing one requires a retrained model.
struct ModelContractConfig {
  std::string version = "gwskynet-v1";
  double skymap_norm = 0.0012;
  double distmu_norm = 12000.0;
  double distsigma_norm = 7000.0;
  double distnorm_norm = 0.003;
  double distance_norm = 10320.0; // Mpc
  projection::CarGeometry grid;

  double channel_norm(ChannelKind kind) const;
};

struct ClassifierConfig {
  std::string model_path;
  std::string model_sha256; // empty = not pinned
  std::vector<std::string> input_names{
      "volume",      "skymap",      "detectors",      "distance",
      "skymap_norm", "distmu_norm", "distsigma_norm", "distnorm_norm"};
  std::string output_name; // empty = network's default output
};

struct DecisionConfig {
  double threshold = 0.5;
};

struct OutputConfig {
  std::string artifacts_dir = "artifacts";
  bool write_channel_images = false;
  bool write_input_json = false;
};

struct RuntimeConfig {
  int parallel_events = 1;
};

struct Config {
  ModelContractConfig model_contract;
  ClassifierConfig classifier;
  DecisionConfig decision;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace gwskynet::config
