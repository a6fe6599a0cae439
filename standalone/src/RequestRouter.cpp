#include "RequestRouter.hpp"

namespace CropAdvisor {

int statusFor(ErrorKind kind){
    switch(kind){
        case ErrorKind::Validation:
        case ErrorKind::BatchTooLarge: return 400;
        case ErrorKind::NotAvailable: return 404;
        case ErrorKind::RetrainInProgress: return 409;
        case ErrorKind::ModelUnavailable:
        case ErrorKind::ModelLoad: return 503;
        case ErrorKind::Inference:
        case ErrorKind::TrainingFailed: return 500;
    }
    return 500;
}

RouterResponse RequestRouter::failure(int status, const std::string& type, const std::string& message,
                                      const std::string& field){
    ++failed;
    RouterResponse r;
    r.status = status;
    r.payload["status"] = status;
    r.payload["error"] = errorJson(type, message, field);
    return r;
}

RouterResponse RequestRouter::route(const std::string& op, const Json::Value& body){
    try {
        int status = 200;
        Json::Value out = dispatch(op, body, status);
        RouterResponse r;
        r.status = status;
        r.payload["status"] = status;
        r.payload["body"] = out;
        return r;
    } catch(const ValidationError& e){
        return failure(statusFor(e.kind()), errorKindName(e.kind()), e.what(), e.field());
    } catch(const AdvisorError& e){
        return failure(statusFor(e.kind()), errorKindName(e.kind()), e.what());
    } catch(const std::exception&){
        // library failures such as jsoncpp type errors on hostile input
        return failure(500, "InternalError", "internal server error");
    }
}

Json::Value RequestRouter::dispatch(const std::string& op, const Json::Value& body, int& status){
    Json::Value out(Json::objectValue);
    if(op == "root"){
        out["message"] = kServiceName;
        out["version"] = kServiceVersion;
        out["status"] = "active";
    } else if(op == "health"){
        out = toJson(facade.health());
    } else if(op == "predict"){
        out = toJson(facade.predict(rawSampleFromJson(body)));
        ++served;
    } else if(op == "predict_batch"){
        if(!body.isObject() || !body["predictions"].isArray()) throw ValidationError("predictions", "", "predictions must be a list");
        const Json::Value& items = body["predictions"];
        const auto outcomes = facade.predictBatch(items.size(), [&items](std::size_t i){
            return rawSampleFromJson(items[static_cast<Json::ArrayIndex>(i)]);
        });
        Json::Value list(Json::arrayValue);
        std::size_t ok = 0;
        for(const auto& o : outcomes){
            list.append(toJson(o));
            if(o.ok()) ++ok;
        }
        served += static_cast<std::uint32_t>(ok);
        out["predictions"] = list;
        out["total_predictions"] = static_cast<Json::UInt64>(outcomes.size());
        out["succeeded"] = static_cast<Json::UInt64>(ok);
        out["failed"] = static_cast<Json::UInt64>(outcomes.size() - ok);
    } else if(op == "model_info"){
        out = toJson(facade.modelInfo());
    } else if(op == "feature_importance"){
        const auto ranked = facade.featureImportance();
        Json::Value map(Json::objectValue);
        for(const auto& kv : ranked) map[kv.first] = kv.second;
        out["feature_importance"] = map;
        out["ranking"] = toJson(ranked);
    } else if(op == "retrain"){
        std::string path;
        if(body.isObject() && body.isMember("data_path")){
            if(!body["data_path"].isString()) throw ValidationError("data_path", "", "data_path must be a string");
            path = body["data_path"].asString();
        }
        const RetrainTicket t = facade.retrain(path);
        status = 202;
        out["accepted"] = t.accepted;
        out["job_id"] = t.jobId;
        out["message"] = "Model retraining started in background";
    } else if(op == "retrain_status"){
        std::optional<std::uint32_t> id;
        if(body.isObject() && body.isMember("job_id")){
            if(!body["job_id"].isUInt()) throw ValidationError("job_id", "", "job_id must be a non-negative integer");
            id = body["job_id"].asUInt();
        }
        const auto job = facade.retrainStatus(id);
        if(!job) throw NotAvailableError(id ? "no such retrain job" : "no retrain job has been started");
        out = toJson(*job);
    } else {
        throw ValidationError("op", "", "unknown operation '" + op + "'");
    }
    return out;
}

RouterResponse RequestRouter::handle(const std::string& line){
    Json::Value request;
    std::string errors;
    RouterResponse r;
    if(!parseJson(line, request, errors) || !request.isObject()){
        r = failure(400, errorKindName(ErrorKind::Validation), "request is not a JSON object");
    } else if(!request["op"].isString()){
        r = failure(400, errorKindName(ErrorKind::Validation), "request has no op", "op");
    } else {
        r = route(request["op"].asString(), request.isMember("body") ? request["body"] : Json::Value(Json::objectValue));
    }
    if(request.isObject() && request.isMember("id")) r.payload["id"] = request["id"];
    return r;
}

}  // namespace CropAdvisor
