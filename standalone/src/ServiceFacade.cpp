#include "ServiceFacade.hpp"
#include "Errors.hpp"
#include "Trainer.hpp"
#include <algorithm>

namespace CropAdvisor {

ServiceFacade::ServiceFacade(const ModelStore& store, RetrainOrchestrator& retrainer, std::string defaultDataPath)
: store(store), retrainer(retrainer), defaultDataPath(std::move(defaultDataPath)), predictor(store), batch(predictor) {}

HealthStatus ServiceFacade::health() const{
    HealthStatus h;
    h.modelLoaded = store.loaded();
    h.status = h.modelLoaded ? "healthy" : "unhealthy";
    h.message = h.modelLoaded ? "Service is running" : "Model not loaded";
    h.timestamp = utcTimestamp();
    return h;
}

ModelInfo ServiceFacade::modelInfo() const{
    const SnapshotPtr snap = predictor.snapshot();
    ModelInfo info;
    info.modelName = kModelName;
    info.modelVersion = snap->version;
    info.serviceVersion = kServiceVersion;
    for(const char* f : kFeatureNames) info.features.emplace_back(f);
    info.supportedCrops = snap->labels;
    info.metrics = snap->metrics;
    return info;
}

std::vector<std::pair<std::string, double>> ServiceFacade::featureImportance() const{
    const SnapshotPtr snap = predictor.snapshot();
    if(!snap->forest.hasImportances()) throw NotAvailableError("the active model does not expose feature importances");
    const auto& imp = snap->forest.importances();
    std::vector<std::pair<std::string, double>> out;
    for(std::size_t i=0;i<imp.size() && i<kFeatureCount;++i) out.emplace_back(kFeatureNames[i], imp[i]);
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.second > b.second; });
    return out;
}

RetrainTicket ServiceFacade::retrain(const std::string& dataPath){
    RetrainTicket t;
    t.jobId = retrainer.start(dataPath.empty() ? defaultDataPath : dataPath);
    t.accepted = true;
    return t;
}

std::optional<RetrainJob> ServiceFacade::retrainStatus(std::optional<std::uint32_t> id) const{
    return id ? retrainer.job(*id) : retrainer.latestJob();
}

}  // namespace CropAdvisor
