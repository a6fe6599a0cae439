#include "AdvisorComponentImpl.hpp"
#include "Errors.hpp"
#include "Trainer.hpp"
#include <Fw/Logger/Logger.hpp>
#include <system_error>

namespace {

CropAdvisor::RetrainState toState(CropAdvisor::RetrainPhase phase){
    switch(phase){
        case CropAdvisor::RetrainPhase::Training: return CropAdvisor::RetrainState::TRAINING;
        case CropAdvisor::RetrainPhase::Validating: return CropAdvisor::RetrainState::VALIDATING;
        case CropAdvisor::RetrainPhase::Publishing: return CropAdvisor::RetrainState::PUBLISHING;
        case CropAdvisor::RetrainPhase::Failed: return CropAdvisor::RetrainState::FAILED;
        case CropAdvisor::RetrainPhase::Idle: break;
    }
    return CropAdvisor::RetrainState::IDLE;
}

}  // namespace

AdvisorComponentImpl::AdvisorComponentImpl(const char* compName)
: AdvisorComponentBase(compName) {}

bool AdvisorComponentImpl::loadModel(const CropAdvisor::AdvisorConfig& config){
    try {
        store.publish(CropAdvisor::ModelStore::loadArtifacts(config.modelDir));
    } catch(const CropAdvisor::ModelLoadError& e){
        Fw::Logger::log("[FATAL] model artifacts in %s rejected: %s\n", config.modelDir.c_str(), e.what());
        return false;
    }
    retrainer = std::make_unique<CropAdvisor::RetrainOrchestrator>(
        store, CropAdvisor::datasetTrainer(config.trainer), config.retrainPolicy());
    facade = std::make_unique<CropAdvisor::ServiceFacade>(store, *retrainer, config.dataPath);
    router = std::make_unique<CropAdvisor::RequestRouter>(*facade);
    Fw::Logger::log("[INFO] serving snapshot %s from %s\n", store.current()->version.c_str(), config.modelDir.c_str());
    return true;
}

std::string AdvisorComponentImpl::serveRequestForBringup(const std::string& line){
    if(!router){
        Json::Value unavailable(Json::objectValue);
        unavailable["status"] = 503;
        unavailable["error"] = CropAdvisor::errorJson("ModelUnavailableError", "model not loaded");
        return CropAdvisor::writeLine(unavailable);
    }
    const CropAdvisor::RouterResponse r = router->handle(line);
    if(r.status >= 400){
        Fw::LogStringArg reason(r.payload["error"]["message"].asString().c_str());
        this->log_WARNING_LO_RequestRejected(static_cast<U16>(r.status), reason);
    }
    return CropAdvisor::writeLine(r.payload);
}

void AdvisorComponentImpl::reportModel(const CropAdvisor::ModelSnapshot& snap){
    Fw::LogStringArg version(snap.version.c_str());
    this->log_ACTIVITY_LO_ModelSummary(version, snap.metrics.testAccuracy,
                                       static_cast<U32>(snap.labels.size()),
                                       static_cast<U32>(snap.forest.featureCount()));
}

void AdvisorComponentImpl::reportJobs(){
    const auto job = retrainer->latestJob();
    if(!job) return;
    if(job->id != announcedJob){
        // jobs started and finished between two ticks are announced late
        Fw::LogStringArg path(job->dataPath.c_str());
        this->log_ACTIVITY_HI_RetrainAccepted(job->id, path);
        announcedJob = job->id;
    }
    if(!job->finished || job->id == reportedJob) return;
    reportedJob = job->id;
    if(job->published){
        Fw::LogStringArg version(job->version.c_str());
        this->log_ACTIVITY_HI_RetrainPublished(job->id, version, job->metrics ? job->metrics->testAccuracy : 0.0);
        summaryPending = true;
    } else {
        Fw::LogStringArg reason(job->message.c_str());
        this->log_WARNING_HI_RetrainRejected(job->id, reason);
    }
}

void AdvisorComponentImpl::schedIn_handler(FwIndexType, U32){
    if(!router) return;
    this->tlmWrite_PredictionsServed(router->predictionsServed());
    this->tlmWrite_RequestErrors(router->requestErrors());
    this->tlmWrite_RetrainState(toState(retrainer->phase()));

    const CropAdvisor::SnapshotPtr snap = store.current();
    if(snap){
        this->tlmWrite_ModelAccuracy(snap->metrics.testAccuracy);
    }
    reportJobs();
    if(summaryPending && snap){
        reportModel(*snap);
        summaryPending = false;
    }
}

void AdvisorComponentImpl::RETRAIN_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, const Fw::CmdStringArg& dataPath){
    if(!facade){
        this->log_WARNING_HI_ModelMissing();
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
        return;
    }
    try {
        facade->retrain(dataPath.toChar());
    } catch(const CropAdvisor::RetrainInProgressError& e){
        this->log_WARNING_LO_RetrainBusy(e.activeJob());
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::BUSY);
        return;
    } catch(const std::system_error& e){
        Fw::Logger::log("[ERROR] retrain worker could not start: %s\n", e.what());
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
        return;
    }
    this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
}

void AdvisorComponentImpl::REPORT_MODEL_cmdHandler(FwOpcodeType opCode, U32 cmdSeq){
    const CropAdvisor::SnapshotPtr snap = store.current();
    if(!snap){
        this->log_WARNING_HI_ModelMissing();
        this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::EXECUTION_ERROR);
        return;
    }
    reportModel(*snap);
    this->cmdResponse_out(opCode, cmdSeq, Fw::CmdResponse::OK);
}
