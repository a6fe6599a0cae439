#pragma once
#include "BatchCoordinator.hpp"
#include "Predictor.hpp"
#include "RetrainOrchestrator.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace CropAdvisor {

constexpr const char* kServiceName = "Crop Recommendation API";
constexpr const char* kServiceVersion = "1.0.0";
constexpr const char* kModelName = "Random Forest Classifier";

struct HealthStatus {
    bool up{true};
    bool modelLoaded{false};
    std::string status;
    std::string message;
    std::string timestamp;
};

struct ModelInfo {
    std::string modelName;
    std::string modelVersion;
    std::string serviceVersion;
    std::vector<std::string> features;
    std::vector<std::string> supportedCrops;
    TrainingMetrics metrics;
};

struct RetrainTicket {
    bool accepted{false};
    std::uint32_t jobId{0};
};

// Read side of the service plus the retrain trigger. Only the retrain
// orchestrator ever publishes into the store.
class ServiceFacade {
public:
    ServiceFacade(const ModelStore& store, RetrainOrchestrator& retrainer, std::string defaultDataPath);

    HealthStatus health() const;
    ModelInfo modelInfo() const;
    // Sorted by descending importance.
    std::vector<std::pair<std::string, double>> featureImportance() const;

    PredictionResult predict(const RawSample& raw) const { return predictor.predict(raw); }
    std::vector<BatchOutcome> predictBatch(const std::vector<RawSample>& items) const { return batch.predictBatch(items); }
    std::vector<BatchOutcome> predictBatch(std::size_t count, const BatchCoordinator::ItemSource& itemAt) const {
        return batch.predictBatch(count, itemAt);
    }

    RetrainTicket retrain(const std::string& dataPath);
    // Latest job when id is empty.
    std::optional<RetrainJob> retrainStatus(std::optional<std::uint32_t> id = std::nullopt) const;

private:
    const ModelStore& store;
    RetrainOrchestrator& retrainer;
    std::string defaultDataPath;
    Predictor predictor;
    BatchCoordinator batch;
};

}  // namespace CropAdvisor
