#pragma once
#include "BatchCoordinator.hpp"
#include "ServiceFacade.hpp"
#include <json/json.h>
#include <string>

namespace CropAdvisor {

// Throws ValidationError naming a missing or non-numeric field. Range checks
// happen later, in the feature engineer.
RawSample rawSampleFromJson(const Json::Value& v);

Json::Value toJson(const PredictionResult& r);
Json::Value toJson(const BatchOutcome& o);
Json::Value toJson(const TrainingMetrics& m);
Json::Value toJson(const HealthStatus& h);
Json::Value toJson(const ModelInfo& info);
Json::Value toJson(const RetrainJob& job);
Json::Value toJson(const std::vector<std::pair<std::string, double>>& importance);

Json::Value errorJson(const std::string& type, const std::string& message, const std::string& field = std::string());

// Compact single-line rendering.
std::string writeLine(const Json::Value& v);
bool parseJson(const std::string& text, Json::Value& out, std::string& errors);

}  // namespace CropAdvisor
