#pragma once

#include "gwskynet/config/configuration.hpp"
#include "gwskynet/model/classifier.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>

namespace gwskynet::model {

// ONNX network evaluated with OpenCV DNN. The network is read once in the
// constructor; forward passes are serialized.
class OnnxClassifier : public Classifier {
public:
    // Throws ModelUnavailableError when the file is missing, does not match
    // the pinned SHA-256, or cannot be parsed.
    explicit OnnxClassifier(const config::ClassifierConfig& cfg);

    static std::shared_ptr<const Classifier> load(const config::ClassifierConfig& cfg);

    double predict(const ClassifierInput& input) const override;
    std::string name() const override;

    const std::string& model_sha256() const { return sha256_; }

private:
    std::string model_path_;
    std::string sha256_;
    std::vector<std::string> input_names_;
    std::string output_name_;

    mutable std::mutex mutex_;
    mutable cv::dnn::Net net_;
};

} // namespace gwskynet::model
