#pragma once
#include "ModelStore.hpp"
#include "Trainer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace CropAdvisor {

enum class RetrainPhase : std::uint8_t { Idle = 0, Training, Validating, Publishing, Failed };

const char* retrainPhaseName(RetrainPhase phase);

struct RetrainJob {
    std::uint32_t id{0};
    std::string dataPath;
    RetrainPhase phase{RetrainPhase::Idle};  // Idle once published, Failed on rejection
    bool finished{false};
    bool published{false};
    std::string message;
    std::string version;
    std::optional<TrainingMetrics> metrics;
};

struct RetrainPolicy {
    double minAccuracy = 0.80;
    double maxRegression = 0.02;
    std::chrono::seconds timeout{600};
    std::string artifactDir;  // empty: publish without persisting
};

class RetrainOrchestrator {
public:
    using Deadline = std::chrono::steady_clock::time_point;
    // Returns the candidate with its held-out rows; validation re-scores
    // the candidate on those rows rather than trusting its reported metrics.
    using TrainFunction = DatasetTrainer;

    RetrainOrchestrator(ModelStore& store, TrainFunction train, RetrainPolicy policy = RetrainPolicy());
    ~RetrainOrchestrator();
    RetrainOrchestrator(const RetrainOrchestrator&) = delete;
    RetrainOrchestrator& operator=(const RetrainOrchestrator&) = delete;

    // Returns the accepted job id; throws RetrainInProgressError while a job runs.
    std::uint32_t start(const std::string& dataPath);

    RetrainPhase phase() const { return current.load(); }
    bool busy() const { return running.load(); }
    std::optional<RetrainJob> job(std::uint32_t id) const;
    std::optional<RetrainJob> latestJob() const;
    // Blocks until the in-flight job, if any, has finished.
    void wait();

private:
    void run(std::uint32_t id, std::string dataPath);
    void attempt(std::uint32_t id, const std::string& dataPath);
    void enter(std::uint32_t id, RetrainPhase phase);
    void finish(std::uint32_t id, bool published, const std::string& message);

    ModelStore& store;
    TrainFunction train;
    RetrainPolicy rules;

    std::atomic<bool> running{false};
    std::atomic<RetrainPhase> current{RetrainPhase::Idle};
    mutable std::mutex mu;
    std::map<std::uint32_t, RetrainJob> jobs;
    std::uint32_t nextId{1};
    std::mutex workerMu;
    std::thread worker;
};

}  // namespace CropAdvisor
