#pragma once

#include "gwskynet/model/tensor_assembler.hpp"

#include <string>

namespace gwskynet::model {

enum class Label {
    ASTROPHYSICAL,
    NOISE
};

inline std::string label_to_string(Label label) {
    switch (label) {
        case Label::ASTROPHYSICAL: return "astrophysical";
        case Label::NOISE: return "noise/terrestrial";
        default: return "unknown";
    }
}

struct Prediction {
    std::string event_id;
    double probability = 0.0;
    Label label = Label::NOISE;
    double threshold = 0.5;
};

// Frozen binary classifier. Implementations are constructed once and
// must be safe to call from several threads.
class Classifier {
public:
    virtual ~Classifier() = default;

    // Probability in [0, 1] that the event is astrophysical.
    virtual double predict(const ClassifierInput& input) const = 0;

    virtual std::string name() const = 0;
};

// probability >= threshold -> ASTROPHYSICAL.
Label decide(double probability, double threshold);

} // namespace gwskynet::model
