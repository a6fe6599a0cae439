#pragma once
#include "FeatureSchema.hpp"
#include "ModelStore.hpp"
#include <map>
#include <string>

namespace CropAdvisor {

struct PredictionResult {
    std::string predictedCrop;
    double confidence{0.0};
    std::map<std::string, double> allProbabilities;
};

class Predictor {
public:
    explicit Predictor(const ModelStore& store) : store(store) {}

    // Reads one snapshot from the store for the whole call.
    PredictionResult predict(const RawSample& raw) const;
    static PredictionResult predict(const RawSample& raw, const ModelSnapshot& snapshot);

    // Throws ModelUnavailableError when nothing has been published.
    SnapshotPtr snapshot() const;

private:
    const ModelStore& store;
};

}  // namespace CropAdvisor
