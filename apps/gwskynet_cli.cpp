#include "gwskynet/config/configuration.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/events.hpp"
#include "gwskynet/core/utils.hpp"
#include "gwskynet/healpix/healpix.hpp"
#include "gwskynet/io/fits_io.hpp"
#include "gwskynet/model/onnx_classifier.hpp"
#include "gwskynet/pipeline/pipeline.hpp"
#include "gwskynet/skymap/skymap.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace gwskynet;

static config::Config load_config_or_default(const std::string& path) {
  if (path.empty()) {
    return config::Config{};
  }
  return config::Config::load(path);
}

static json prediction_to_json(const model::Prediction& p, const fs::path& path) {
  return {{"event_id", p.event_id},
          {"path", path.string()},
          {"probability", p.probability},
          {"label", model::label_to_string(p.label)},
          {"threshold", p.threshold}};
}

static io::FitsHeader car_header(const projection::CarGeometry& g, ChannelKind kind,
                                 double norm, const std::string& event_id) {
  io::FitsHeader h;
  h.set("CTYPE1", "RA---CAR");
  h.set("CTYPE2", "DEC--CAR");
  h.set("CUNIT1", "deg");
  h.set("CUNIT2", "deg");
  h.set("CRPIX1", g.crpix1);
  h.set("CRPIX2", g.crpix2);
  h.set("CRVAL1", g.crval1);
  h.set("CRVAL2", g.crval2);
  h.set("CDELT1", g.cdelt1);
  h.set("CDELT2", g.cdelt2);
  h.set("RADESYS", "ICRS");
  h.set("OBJECT", event_id);
  h.set("CHANNEL", channel_to_string(kind));
  h.set("CHNORM", norm);
  return h;
}

// Writes <out_dir>/<event_id>/{channel}_{reprojected,normalized}.fits and
// input.json. Returns the event directory.
static fs::path write_artifacts(const pipeline::PreparedEvent& prepared,
                                const config::Config& cfg, const std::string& out_dir,
                                const std::string& file, bool images, bool input_json) {
  const fs::path dir = fs::path(out_dir) / prepared.metadata.event_id;
  fs::create_directories(dir);

  for (ChannelKind kind : kAllChannels) {
    if (!images) break;
    const std::string name = channel_to_string(kind);
    const auto& full = prepared.reprojected[kind];
    io::write_fits_float(dir / (name + "_reprojected.fits"),
                         full.values.cast<float>(),
                         car_header(full.geometry, kind, 0.0, prepared.metadata.event_id));

    const auto& ch = prepared.channels[kind];
    io::write_fits_float(dir / (name + "_normalized.fits"),
                         ch.grid.values.cast<float>(),
                         car_header(ch.grid.geometry, kind, ch.norm,
                                    prepared.metadata.event_id));
  }

  if (!input_json) return dir;

  json doc;
  doc["inputs"] = model::to_json(prepared.input, cfg.classifier.input_names);
  doc["event_id"] = prepared.metadata.event_id;
  doc["source"] = file;
  doc["source_sha256"] = core::sha256_file(file);
  doc["contract"] = cfg.model_contract.version;
  core::write_text(dir / "input.json", doc.dump(2));

  return dir;
}

static int classify_command(const std::string& config_path, const std::string& model_path,
                            double threshold, int jobs, const std::string& events_path,
                            const std::vector<std::string>& files) {
  config::Config cfg;
  std::shared_ptr<const model::Classifier> classifier;
  try {
    cfg = load_config_or_default(config_path);
    if (!model_path.empty()) cfg.classifier.model_path = model_path;
    if (threshold >= 0.0) cfg.decision.threshold = threshold;
    if (jobs > 0) cfg.runtime.parallel_events = jobs;
    cfg.validate();
    classifier = model::OnnxClassifier::load(cfg.classifier);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream events_file;
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();

  pipeline::Pipeline pipe(cfg, classifier);
  if (!events_path.empty()) {
    events_file.open(events_path, std::ios::out | std::ios::app);
    if (!events_file) {
      std::cerr << "Error: cannot open events log " << events_path << std::endl;
      return 1;
    }
    pipe.set_event_sink(&emitter, &events_file, run_id);
    emitter.run_start(run_id,
                      {{"model", classifier->name()},
                       {"contract", cfg.model_contract.version},
                       {"files", files.size()}},
                      events_file);
  }

  const bool write_images = cfg.output.write_channel_images;
  const bool write_json = cfg.output.write_input_json;

  std::vector<json> results(files.size());
  std::atomic<size_t> next{0};
  std::atomic<size_t> n_failed{0};
  std::mutex out_mutex;

  auto worker = [&]() {
    for (;;) {
      const size_t i = next.fetch_add(1);
      if (i >= files.size()) return;
      try {
        pipeline::PreparedEvent prepared = pipe.prepare_file(files[i]);
        if (write_images || write_json) {
          write_artifacts(prepared, cfg, cfg.output.artifacts_dir, files[i], write_images,
                          write_json);
        }
        results[i] = prediction_to_json(pipe.classify(prepared), files[i]);
      } catch (const std::exception& e) {
        n_failed++;
        results[i] = {{"path", files[i]}, {"error", e.what()}};
        if (const auto* ee = dynamic_cast<const EventError*>(&e)) {
          if (!ee->event_id().empty()) results[i]["event_id"] = ee->event_id();
        }
        if (events_file.is_open()) emitter.error(run_id, files[i] + ": " + e.what(), events_file);
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cerr << "Error: " << files[i] << ": " << e.what() << std::endl;
      }
    }
  };

  const int n_workers =
      std::max(1, std::min<int>(cfg.runtime.parallel_events, static_cast<int>(files.size())));
  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(n_workers));
  for (int w = 0; w < n_workers; ++w) {
    workers.emplace_back(worker);
  }
  for (auto& t : workers) {
    t.join();
  }

  for (size_t i = 0; i < results.size(); ++i) {
    std::cout << results[i].dump() << std::endl;
  }

  const bool ok = n_failed.load() == 0;
  if (events_file.is_open()) {
    emitter.run_end(run_id, ok, ok ? "ok" : "partial", events_file);
  }
  return ok ? 0 : 1;
}

// Preparation only; no classifier is needed.
class NullClassifier : public model::Classifier {
public:
  double predict(const model::ClassifierInput&) const override {
    throw PipelineError("prepare does not run the classifier");
  }
  std::string name() const override { return "none"; }
};

static int prepare_command(const std::string& config_path, const std::string& out_dir,
                           const std::string& file) {
  try {
    config::Config cfg = load_config_or_default(config_path);
    pipeline::Pipeline pipe(cfg, std::make_shared<const NullClassifier>());
    pipeline::PreparedEvent prepared = pipe.prepare_file(file);

    const fs::path dir = write_artifacts(prepared, cfg, out_dir, file, true, true);

    std::cout << json{{"event_id", prepared.metadata.event_id},
                      {"artifacts", dir.string()}}.dump()
              << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

static int synthesize_command(const std::string& out_path, int64_t nside,
                              const std::string& event_id, double distmean,
                              const std::string& instruments) {
  try {
    healpix::HealpixGrid grid(nside);
    const auto npix = static_cast<size_t>(grid.npix());

    skymap::SkyMap sm;
    sm.map.nside = nside;
    sm.map.ordering = PixelOrdering::NESTED;
    sm.map.layers[ChannelKind::SKYMAP].assign(npix, 1.0 / static_cast<double>(npix));
    sm.map.layers[ChannelKind::DISTMU].assign(npix, distmean);
    sm.map.layers[ChannelKind::DISTSIGMA].assign(npix, 0.3 * distmean);
    sm.map.layers[ChannelKind::DISTNORM].assign(npix, 1.0 / (distmean * distmean));

    sm.metadata.event_id = event_id;
    sm.metadata.distmean = distmean;
    sm.metadata.diststd = 0.3 * distmean;
    for (const auto& name : skymap::parse_instruments(instruments)) {
      Detector d;
      if (string_to_detector(name, d)) sm.metadata.instruments.push_back(d);
      else sm.metadata.ignored_instruments.push_back(name);
    }

    skymap::write_skymap(out_path, sm);
    std::cout << json{{"path", out_path}, {"nside", nside}, {"npix", npix}}.dump()
              << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

static int config_command(const std::string& config_path, bool print) {
  try {
    config::Config cfg = load_config_or_default(config_path);
    cfg.validate();
    if (!print) {
      std::cout << "config ok" << std::endl;
      return 0;
    }
    YAML::Emitter em;
    em << cfg.to_yaml();
    std::cout << em.c_str() << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int main(int argc, char* argv[]) {
  CLI::App app{"gwskynet - sky map classifier"};
  app.require_subcommand(1);

  std::string config_path;
  std::string model_path;
  std::string events_path;
  std::string out_path;
  double threshold = -1.0;
  int jobs = 0;
  std::vector<std::string> files;
  std::string prepare_file;
  int64_t nside = 64;
  std::string event_id = "S000000synth";
  double distmean = 400.0;
  std::string instruments = "H1,L1,V1";
  bool print_config = false;

  auto classify_cmd = app.add_subcommand("classify", "Classify sky map files");
  classify_cmd->add_option("--config", config_path, "Path to config.yaml");
  classify_cmd->add_option("--model", model_path, "ONNX model (overrides config)");
  classify_cmd->add_option("--threshold", threshold, "Decision threshold in [0,1]");
  classify_cmd->add_option("--jobs", jobs, "Parallel events (overrides config)");
  classify_cmd->add_option("--events", events_path, "Append JSON-lines events to this file");
  classify_cmd->add_option("files", files, "Sky map FITS files")->required();

  auto prepare_cmd = app.add_subcommand("prepare", "Write reprojected channels and model inputs");
  prepare_cmd->add_option("--config", config_path, "Path to config.yaml");
  prepare_cmd->add_option("--out", out_path, "Artifacts directory")->default_val("artifacts");
  prepare_cmd->add_option("file", prepare_file, "Sky map FITS file")->required();

  auto synth_cmd = app.add_subcommand("synthesize", "Write a uniform sky map for testing");
  synth_cmd->add_option("--out", out_path, "Output FITS path")->required();
  synth_cmd->add_option("--nside", nside, "HEALPix resolution (power of two)");
  synth_cmd->add_option("--event-id", event_id, "OBJECT keyword");
  synth_cmd->add_option("--distmean", distmean, "Mean distance in Mpc");
  synth_cmd->add_option("--instruments", instruments, "Comma-separated detectors");

  auto config_cmd = app.add_subcommand("config", "Validate and print configuration");
  config_cmd->add_option("--config", config_path, "Path to config.yaml");
  config_cmd->add_flag("--print", print_config, "Print the effective configuration");

  CLI11_PARSE(app, argc, argv);

  if (classify_cmd->parsed()) {
    return classify_command(config_path, model_path, threshold, jobs, events_path, files);
  }
  if (prepare_cmd->parsed()) {
    return prepare_command(config_path, out_path, prepare_file);
  }
  if (synth_cmd->parsed()) {
    return synthesize_command(out_path, nside, event_id, distmean, instruments);
  }
  if (config_cmd->parsed()) {
    return config_command(config_path, print_config);
  }
  return 1;
}
