#include "gwskynet/model/classifier.hpp"
#include "gwskynet/core/errors.hpp"

#include <cmath>

namespace gwskynet::model {

Label decide(double probability, double threshold) {
    if (std::isnan(probability)) {
        throw ClassificationError("classifier probability is NaN");
    }
    return probability >= threshold ? Label::ASTROPHYSICAL : Label::NOISE;
}

} // namespace gwskynet::model
