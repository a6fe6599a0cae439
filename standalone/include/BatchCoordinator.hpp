#pragma once
#include "Errors.hpp"
#include "Predictor.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace CropAdvisor {

constexpr std::size_t kMaxBatchSize = 100;

struct BatchError {
    ErrorKind kind;
    std::string message;
    std::string field;
};

struct BatchOutcome {
    std::size_t index;
    std::optional<PredictionResult> result;
    std::optional<BatchError> error;
    bool ok() const { return result.has_value(); }
};

class BatchCoordinator {
public:
    using ItemSource = std::function<RawSample(std::size_t)>;

    explicit BatchCoordinator(const Predictor& predictor, std::size_t limit = kMaxBatchSize)
        : predictor(predictor), limit(limit) {}

    std::vector<BatchOutcome> predictBatch(const std::vector<RawSample>& items) const;
    // itemAt runs inside the per-item guard, so an item that fails to
    // decode is recorded at its index like any other item error.
    std::vector<BatchOutcome> predictBatch(std::size_t count, const ItemSource& itemAt) const;

private:
    const Predictor& predictor;
    std::size_t limit;
};

}  // namespace CropAdvisor
