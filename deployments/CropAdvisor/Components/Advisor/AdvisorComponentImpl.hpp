#pragma once
// Derived implementation of the generated base component
#include <cstdint>
#include <memory>
#include <string>
#include "AdvisorConfig.hpp"
#include "ModelStore.hpp"
#include "RequestRouter.hpp"
#include "RetrainOrchestrator.hpp"
#include "ServiceFacade.hpp"
#include "deployments/CropAdvisor/Components/Advisor/AdvisorComponentAc.hpp"
#include <Fw/Types/String.hpp>

class AdvisorComponentImpl : public ::CropAdvisor::AdvisorComponentBase {
  public:
    explicit AdvisorComponentImpl(const char* compName);

    // Loads the startup snapshot and builds the service around it. Returns
    // false when the artifacts are rejected; the process must not serve then.
    bool loadModel(const CropAdvisor::AdvisorConfig& config);

    // Bring-up path for the ingress worker: one request line in, one
    // response line out. Callable from any thread.
    std::string serveRequestForBringup(const std::string& line);

  private:
    // Port handler: schedIn
    void schedIn_handler(FwIndexType portNum, U32 context) override;

    // Command handlers
    void RETRAIN_cmdHandler(FwOpcodeType opCode, U32 cmdSeq, const Fw::CmdStringArg& dataPath) override;
    void REPORT_MODEL_cmdHandler(FwOpcodeType opCode, U32 cmdSeq) override;

    // Helpers
    void reportJobs();
    void reportModel(const CropAdvisor::ModelSnapshot& snap);

    // Runtime
    CropAdvisor::ModelStore store;
    std::unique_ptr<CropAdvisor::RetrainOrchestrator> retrainer;
    std::unique_ptr<CropAdvisor::ServiceFacade> facade;
    std::unique_ptr<CropAdvisor::RequestRouter> router;
    std::uint32_t announcedJob{0};
    std::uint32_t reportedJob{0};
    bool summaryPending{true};
};
