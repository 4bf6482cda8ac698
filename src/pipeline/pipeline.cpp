#include "gwskynet/pipeline/pipeline.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/skymap/sanitize.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace gwskynet::pipeline {

using json = nlohmann::json;

Pipeline::Pipeline(config::Config cfg, std::shared_ptr<const model::Classifier> classifier)
    : cfg_(std::move(cfg)), classifier_(std::move(classifier)) {
    cfg_.validate();
    if (!classifier_) {
        throw ModelUnavailableError("no classifier supplied to pipeline");
    }
}

void Pipeline::set_event_sink(core::EventEmitter* emitter, std::ostream* out,
                              const std::string& run_id) {
    emitter_ = emitter;
    out_ = out;
    run_id_ = run_id;
}

void Pipeline::stage_start(const std::string& event_id, Stage stage) const {
    if (emitter_ && out_) {
        emitter_->stage_start(run_id_, event_id, stage, *out_);
    }
}

void Pipeline::stage_end(const std::string& event_id, Stage stage, const json& extra) const {
    if (emitter_ && out_) {
        emitter_->stage_end(run_id_, event_id, stage, "ok", extra, *out_);
    }
}

PreparedEvent Pipeline::prepare(const skymap::SkyMap& skymap) const {
    const std::string& event_id = skymap.metadata.event_id;
    const auto& contract = cfg_.model_contract;

    try {
        PreparedEvent prepared;
        prepared.metadata = skymap.metadata;

        stage_start(event_id, Stage::SANITIZE);
        skymap::SphericalMap clean = skymap::sanitize_distance_layers(skymap.map);
        stage_end(event_id, Stage::SANITIZE);

        stage_start(event_id, Stage::REPROJECT);
        prepared.reprojected = projection::reproject_map(clean, contract.grid);
        stage_end(event_id, Stage::REPROJECT,
                  {{"nside", clean.nside},
                   {"ordering", pixel_ordering_to_string(clean.ordering)}});

        stage_start(event_id, Stage::NORMALIZE);
        ChannelArray<image::ScaledChannel> scaled;
        json norms = json::object();
        for (ChannelKind kind : kAllChannels) {
            scaled[kind] = image::normalize_channel(prepared.reprojected[kind],
                                                    contract.channel_norm(kind));
            norms[channel_to_string(kind)] = scaled[kind].norm;
        }
        stage_end(event_id, Stage::NORMALIZE, {{"norms", norms}});

        stage_start(event_id, Stage::DOWNSAMPLE);
        for (ChannelKind kind : kAllChannels) {
            prepared.channels[kind].grid = image::max_pool_2x2(scaled[kind].grid);
            prepared.channels[kind].norm = scaled[kind].norm;
        }
        stage_end(event_id, Stage::DOWNSAMPLE);

        stage_start(event_id, Stage::ASSEMBLE);
        prepared.input = model::assemble_input(prepared.channels, prepared.metadata, contract);
        stage_end(event_id, Stage::ASSEMBLE);

        return prepared;
    } catch (EventError& e) {
        if (e.event_id().empty()) {
            e.set_event_id(event_id);
        }
        throw;
    }
}

PreparedEvent Pipeline::prepare_file(const fs::path& path) const {
    stage_start(path.filename().string(), Stage::READ);
    skymap::SkyMap skymap = skymap::read_skymap(path);
    stage_end(skymap.metadata.event_id, Stage::READ,
              {{"path", path.string()},
               {"nside", skymap.map.nside},
               {"multiorder", skymap.metadata.multiorder_source}});

    if (emitter_ && out_) {
        for (const auto& name : skymap.metadata.ignored_instruments) {
            emitter_->warning(run_id_,
                              skymap.metadata.event_id + ": ignoring instrument " + name,
                              *out_);
        }
    }
    return prepare(skymap);
}

model::Prediction Pipeline::classify(const PreparedEvent& prepared) const {
    const std::string& event_id = prepared.metadata.event_id;
    stage_start(event_id, Stage::CLASSIFY);

    model::Prediction prediction;
    prediction.event_id = event_id;
    prediction.threshold = cfg_.decision.threshold;
    try {
        prediction.probability = classifier_->predict(prepared.input);
        const double p = prediction.probability;
        if (!std::isnan(p) && (p < 0.0 || p > 1.0)) {
            throw ClassificationError(classifier_->name() + " returned " + std::to_string(p) +
                                      ", outside [0,1]");
        }
        prediction.label = model::decide(p, prediction.threshold);
    } catch (EventError& e) {
        if (e.event_id().empty()) {
            e.set_event_id(event_id);
        }
        throw;
    } catch (const PipelineError& e) {
        throw ClassificationError(e.what(), event_id);
    }

    stage_end(event_id, Stage::CLASSIFY, {{"probability", prediction.probability}});

    if (emitter_ && out_) {
        emitter_->event_classified(run_id_, event_id,
                                   {{"probability", prediction.probability},
                                    {"label", model::label_to_string(prediction.label)},
                                    {"threshold", prediction.threshold}},
                                   *out_);
    }
    return prediction;
}

model::Prediction Pipeline::classify(const skymap::SkyMap& skymap) const {
    return classify(prepare(skymap));
}

model::Prediction Pipeline::classify_file(const fs::path& path) const {
    return classify(prepare_file(path));
}

} // namespace gwskynet::pipeline
