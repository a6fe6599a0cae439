#pragma once
#include "RetrainOrchestrator.hpp"
#include "Trainer.hpp"
#include <string>

namespace CropAdvisor {

struct AdvisorConfig {
    std::string modelDir{"models"};
    std::string dataPath{"data/Crop_recommendation.csv"};
    std::string socketPath{"/tmp/crop_advisor.sock"};
    double minAccuracy{0.80};
    double maxRegression{0.02};
    long trainTimeoutSeconds{600};
    TrainerOptions trainer;

    RetrainPolicy retrainPolicy() const;
};

// Whitespace separated "key value" records. A missing file leaves the
// defaults in place; unknown keys are skipped. Returns false if the file
// exists but a known key carries an unparseable value.
bool loadConfig(const std::string& path, AdvisorConfig& config);

}  // namespace CropAdvisor
