#include "gwskynet/model/onnx_classifier.hpp"
#include "gwskynet/core/errors.hpp"
#include "gwskynet/core/utils.hpp"

#include <opencv2/core.hpp>

#include <cstring>
#include <filesystem>

namespace gwskynet::model {

namespace fs = std::filesystem;

namespace {

cv::Mat to_blob(const Tensor& t) {
    std::vector<int> sizes(t.shape.begin(), t.shape.end());
    cv::Mat blob(static_cast<int>(sizes.size()), sizes.data(), CV_32F);
    std::memcpy(blob.ptr<float>(), t.data.data(), t.data.size() * sizeof(float));
    return blob;
}

} // namespace

OnnxClassifier::OnnxClassifier(const config::ClassifierConfig& cfg)
    : model_path_(cfg.model_path),
      input_names_(cfg.input_names),
      output_name_(cfg.output_name) {
    if (model_path_.empty()) {
        throw ModelUnavailableError("classifier.model_path is not set");
    }
    if (!fs::exists(model_path_)) {
        throw ModelUnavailableError("model file not found: " + model_path_);
    }
    if (input_names_.size() != kClassifierInputCount) {
        throw ModelUnavailableError("classifier needs exactly 8 input names");
    }

    try {
        sha256_ = core::sha256_file(model_path_);
    } catch (const IOError& e) {
        throw ModelUnavailableError(e.what());
    }
    if (!cfg.model_sha256.empty() && core::to_lower(cfg.model_sha256) != sha256_) {
        throw ModelUnavailableError("model SHA-256 " + sha256_ + " does not match pinned " +
                                    cfg.model_sha256);
    }

    try {
        net_ = cv::dnn::readNetFromONNX(model_path_);
    } catch (const cv::Exception& e) {
        throw ModelUnavailableError("cannot load " + model_path_ + ": " + e.what());
    }
    if (net_.empty()) {
        throw ModelUnavailableError("empty network in " + model_path_);
    }
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
}

std::shared_ptr<const Classifier> OnnxClassifier::load(const config::ClassifierConfig& cfg) {
    return std::make_shared<const OnnxClassifier>(cfg);
}

double OnnxClassifier::predict(const ClassifierInput& input) const {
    auto tensors = input.ordered();

    cv::Mat out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            for (std::size_t i = 0; i < kClassifierInputCount; ++i) {
                net_.setInput(to_blob(*tensors[i]), input_names_[i]);
            }
            out = output_name_.empty() ? net_.forward() : net_.forward(output_name_);
        } catch (const cv::Exception& e) {
            throw ClassificationError(std::string("forward pass failed: ") + e.what());
        }
    }

    if (out.empty() || out.total() < 1) {
        throw ClassificationError("classifier produced no output");
    }
    cv::Mat out32;
    out.convertTo(out32, CV_32F);
    return static_cast<double>(out32.ptr<float>()[0]);
}

std::string OnnxClassifier::name() const {
    return "onnx:" + fs::path(model_path_).filename().string();
}

} // namespace gwskynet::model
