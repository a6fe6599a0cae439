#include "Predictor.hpp"
#include "Errors.hpp"
#include "FeatureEngineer.hpp"
#include <cmath>

namespace CropAdvisor {

SnapshotPtr Predictor::snapshot() const{
    SnapshotPtr snap = store.current();
    if(!snap) throw ModelUnavailableError();
    return snap;
}

PredictionResult Predictor::predict(const RawSample& raw) const{
    const SnapshotPtr snap = snapshot();
    return predict(raw, *snap);
}

PredictionResult Predictor::predict(const RawSample& raw, const ModelSnapshot& snapshot){
    const EngineeredFeatureVector x = engineer(raw);
    std::vector<double> p = snapshot.forest.proba(snapshot.transform.apply(x));
    if(p.size() != snapshot.labels.size()) throw InferenceError("classifier output does not match the label set");

    double Z = 0;
    for(double v : p){
        if(!std::isfinite(v) || v < 0) throw InferenceError("classifier produced an invalid probability");
        Z += v;
    }
    if(!(Z > 0)) throw InferenceError("classifier produced no usable probability mass");

    PredictionResult out;
    std::size_t best = 0;
    for(std::size_t i=0;i<p.size();++i){
        p[i] /= Z;
        out.allProbabilities[snapshot.labels[i]] = p[i];
        if(i == 0) continue;
        // exact ties go to the lexicographically smaller label
        if(p[i] > p[best] || (p[i] == p[best] && snapshot.labels[i] < snapshot.labels[best])) best = i;
    }
    out.predictedCrop = snapshot.labels[best];
    out.confidence = p[best];
    return out;
}

}  // namespace CropAdvisor
