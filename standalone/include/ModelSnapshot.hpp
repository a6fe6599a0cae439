#pragma once
#include "FeatureTransform.hpp"
#include "Forest.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace CropAdvisor {

struct TrainingMetrics {
    double trainAccuracy{0.0};
    double testAccuracy{0.0};
    std::size_t trainSamples{0};
    std::size_t testSamples{0};
    std::size_t features{0};
    std::size_t classes{0};
    std::string trainedAt;
    std::map<std::string, double> classRecall;  // crops present in the held-out rows
};

// Published as a whole and never mutated afterwards.
struct ModelSnapshot {
    std::string version;
    std::vector<std::string> labels;
    FeatureTransform transform;
    Forest forest;
    TrainingMetrics metrics;
};

using SnapshotPtr = std::shared_ptr<const ModelSnapshot>;

// True when labels are exactly the supported crop set, in encoder order.
bool hasCropLabelSet(const std::vector<std::string>& labels);

}  // namespace CropAdvisor
