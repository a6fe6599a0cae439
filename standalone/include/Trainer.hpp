#pragma once
#include "FeatureSchema.hpp"
#include "ModelSnapshot.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace CropAdvisor {

struct LabeledSample {
    RawSample raw;
    std::string label;
};

struct TrainerOptions {
    double testFraction = 0.2;
    std::uint32_t seed = 42;
    ForestParams forest;
};

// Reads a CSV with the columns N,P,K,temperature,humidity,ph,rainfall,label
// in any order. Throws TrainingFailedError naming the offending line.
std::vector<LabeledSample> loadDataset(const std::string& csvPath);

struct TrainedModel {
    SnapshotPtr snapshot;
    std::vector<LabeledSample> holdout;  // rows kept out of fitting
};

TrainedModel trainModel(const std::vector<LabeledSample>& samples, const TrainerOptions& options,
                        const std::string& version,
                        std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());

SnapshotPtr trainSnapshot(const std::vector<LabeledSample>& samples, const TrainerOptions& options,
                          const std::string& version,
                          std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());

// Serves every held-out row through the snapshot and records test accuracy,
// test sample count and per-crop recall in metrics.
void scoreHoldout(const ModelSnapshot& snapshot, const std::vector<LabeledSample>& holdout, TrainingMetrics& metrics);

using DatasetTrainer = std::function<TrainedModel(const std::string& csvPath, const std::string& version,
                                                  std::chrono::steady_clock::time_point deadline)>;

// loadDataset followed by trainModel; the shape the retrain orchestrator runs.
DatasetTrainer datasetTrainer(const TrainerOptions& options);

// UTC timestamp, e.g. 2026-10-19T12:05:01Z.
std::string utcTimestamp();

}  // namespace CropAdvisor
