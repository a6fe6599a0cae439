#include "BatchCoordinator.hpp"

namespace CropAdvisor {

std::vector<BatchOutcome> BatchCoordinator::predictBatch(const std::vector<RawSample>& items) const{
    return predictBatch(items.size(), [&items](std::size_t i){ return items[i]; });
}

std::vector<BatchOutcome> BatchCoordinator::predictBatch(std::size_t count, const ItemSource& itemAt) const{
    if(count > limit) throw BatchTooLargeError(count, limit);
    if(count == 0) throw ValidationError("predictions", "[1, " + std::to_string(limit) + "]", "batch must contain at least one prediction");

    // one snapshot for every item of the batch
    const SnapshotPtr snap = predictor.snapshot();

    std::vector<BatchOutcome> out;
    out.reserve(count);
    for(std::size_t i=0;i<count;++i){
        BatchOutcome o{i, std::nullopt, std::nullopt};
        try {
            o.result = Predictor::predict(itemAt(i), *snap);
        } catch(const ValidationError& e){
            o.error = BatchError{e.kind(), e.what(), e.field()};
        } catch(const AdvisorError& e){
            o.error = BatchError{e.kind(), e.what(), std::string()};
        }
        out.push_back(std::move(o));
    }
    return out;
}

}  // namespace CropAdvisor
