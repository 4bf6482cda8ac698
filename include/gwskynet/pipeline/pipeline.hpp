#pragma once

#include "gwskynet/config/configuration.hpp"
#include "gwskynet/core/events.hpp"
#include "gwskynet/image/normalization.hpp"
#include "gwskynet/model/classifier.hpp"
#include "gwskynet/model/tensor_assembler.hpp"
#include "gwskynet/projection/reproject.hpp"
#include "gwskynet/skymap/skymap.hpp"

#include <memory>
#include <ostream>
#include <string>

namespace gwskynet::pipeline {

// Everything computed for one event before the classifier runs.
struct PreparedEvent {
    skymap::EventMetadata metadata;
    ChannelArray<projection::RectGrid> reprojected;
    ChannelArray<image::NormalizedChannel> channels;
    model::ClassifierInput input;
};

// Read -> sanitize -> reproject -> normalize -> downsample -> assemble ->
// classify -> decide. Holds no per-event state, so one instance may be
// used from several threads as long as the classifier allows it.
class Pipeline {
public:
    Pipeline(config::Config cfg, std::shared_ptr<const model::Classifier> classifier);

    // Stage events are written to `out` when both are set.
    void set_event_sink(core::EventEmitter* emitter, std::ostream* out,
                        const std::string& run_id);

    PreparedEvent prepare(const skymap::SkyMap& skymap) const;
    PreparedEvent prepare_file(const fs::path& path) const;

    model::Prediction classify(const PreparedEvent& prepared) const;
    model::Prediction classify(const skymap::SkyMap& skymap) const;
    model::Prediction classify_file(const fs::path& path) const;

    const config::Config& config() const { return cfg_; }
    const model::Classifier& classifier() const { return *classifier_; }

private:
    void stage_start(const std::string& event_id, Stage stage) const;
    void stage_end(const std::string& event_id, Stage stage,
                   const core::json& extra = core::json::object()) const;

    config::Config cfg_;
    std::shared_ptr<const model::Classifier> classifier_;

    core::EventEmitter* emitter_ = nullptr;
    std::ostream* out_ = nullptr;
    std::string run_id_;
};

} // namespace gwskynet::pipeline
