#include "JsonCodec.hpp"
#include "Errors.hpp"
#include <memory>
#include <sstream>

namespace CropAdvisor {

static std::string s_bound(const RawField& f){
    std::ostringstream s; s << "[" << f.lo << ", " << f.hi << "]";
    return s.str();
}

RawSample rawSampleFromJson(const Json::Value& v){
    if(!v.isObject()) throw ValidationError("prediction input must be a JSON object");
    RawSample raw;
    for(const auto& f : kRawFields){
        if(!v.isMember(f.name)) throw ValidationError(f.name, s_bound(f), std::string("field ") + f.name + " is required");
        const Json::Value& x = v[f.name];
        if(!x.isNumeric()) throw ValidationError(f.name, s_bound(f), std::string(f.name) + " must be a number");
        raw.*(f.member) = x.asDouble();
    }
    return raw;
}

Json::Value toJson(const PredictionResult& r){
    Json::Value out(Json::objectValue);
    out["predicted_crop"] = r.predictedCrop;
    out["confidence"] = r.confidence;
    Json::Value probs(Json::objectValue);
    for(const auto& kv : r.allProbabilities) probs[kv.first] = kv.second;
    out["all_probabilities"] = probs;
    return out;
}

Json::Value toJson(const BatchOutcome& o){
    Json::Value out(Json::objectValue);
    out["index"] = static_cast<Json::UInt64>(o.index);
    out["ok"] = o.ok();
    if(o.result) out["result"] = toJson(*o.result);
    if(o.error) out["error"] = errorJson(errorKindName(o.error->kind), o.error->message, o.error->field);
    return out;
}

Json::Value toJson(const TrainingMetrics& m){
    Json::Value out(Json::objectValue);
    out["train_accuracy"] = m.trainAccuracy;
    out["test_accuracy"] = m.testAccuracy;
    out["train_samples"] = static_cast<Json::UInt64>(m.trainSamples);
    out["test_samples"] = static_cast<Json::UInt64>(m.testSamples);
    out["features"] = static_cast<Json::UInt64>(m.features);
    out["classes"] = static_cast<Json::UInt64>(m.classes);
    if(!m.trainedAt.empty()) out["trained_at"] = m.trainedAt;
    if(!m.classRecall.empty()){
        Json::Value recall(Json::objectValue);
        for(const auto& kv : m.classRecall) recall[kv.first] = kv.second;
        out["class_recall"] = recall;
    }
    return out;
}

Json::Value toJson(const HealthStatus& h){
    Json::Value out(Json::objectValue);
    out["status"] = h.status;
    out["message"] = h.message;
    out["model_loaded"] = h.modelLoaded;
    out["timestamp"] = h.timestamp;
    return out;
}

Json::Value toJson(const ModelInfo& info){
    Json::Value out(Json::objectValue);
    out["model_name"] = info.modelName;
    out["model_version"] = info.modelVersion;
    out["service_version"] = info.serviceVersion;
    Json::Value features(Json::arrayValue);
    for(const auto& f : info.features) features.append(f);
    out["features"] = features;
    out["feature_count"] = static_cast<Json::UInt64>(info.features.size());
    Json::Value crops(Json::arrayValue);
    for(const auto& c : info.supportedCrops) crops.append(c);
    out["supported_crops"] = crops;
    out["class_count"] = static_cast<Json::UInt64>(info.supportedCrops.size());
    out["metrics"] = toJson(info.metrics);
    out["accuracy"] = info.metrics.testAccuracy;
    return out;
}

Json::Value toJson(const RetrainJob& job){
    Json::Value out(Json::objectValue);
    out["job_id"] = job.id;
    out["data_path"] = job.dataPath;
    out["state"] = retrainPhaseName(job.phase);
    out["finished"] = job.finished;
    out["published"] = job.published;
    out["message"] = job.message;
    if(!job.version.empty()) out["model_version"] = job.version;
    if(job.metrics) out["metrics"] = toJson(*job.metrics);
    return out;
}

Json::Value toJson(const std::vector<std::pair<std::string, double>>& importance){
    // array keeps the descending order that an object would lose
    Json::Value out(Json::arrayValue);
    for(const auto& kv : importance){
        Json::Value e(Json::objectValue);
        e["feature"] = kv.first;
        e["importance"] = kv.second;
        out.append(e);
    }
    return out;
}

Json::Value errorJson(const std::string& type, const std::string& message, const std::string& field){
    Json::Value out(Json::objectValue);
    out["type"] = type;
    out["message"] = message;
    if(!field.empty()) out["field"] = field;
    return out;
}

std::string writeLine(const Json::Value& v){
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}

bool parseJson(const std::string& text, Json::Value& out, std::string& errors){
    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

}  // namespace CropAdvisor
