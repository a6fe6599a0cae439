#pragma once
#include "FeatureSchema.hpp"
#include <iosfwd>
#include <vector>

namespace CropAdvisor {

// Standard scaler fitted on the training rows of the engineered features.
class FeatureTransform {
public:
    FeatureTransform();
    void fit(const std::vector<EngineeredFeatureVector>& rows);
    std::vector<double> apply(const EngineeredFeatureVector& x) const;
    // Reads the body that follows the snapshot header. Returns false on a
    // malformed record or on thresholds that differ from FeatureSchema.hpp.
    bool load(std::istream& in);
    void save(std::ostream& out) const;
    const EngineeredFeatureVector& mean() const { return mu; }
    const EngineeredFeatureVector& scale() const { return sd; }
private:
    EngineeredFeatureVector mu;
    EngineeredFeatureVector sd;
};

}  // namespace CropAdvisor
