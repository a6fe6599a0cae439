#pragma once

#include "AdvisorConfig.hpp"
#include "Fw/Log/LogString.hpp"
#include "Svc/Health/HealthComponentImpl.hpp"
#include "Svc/Subtopologies/CdhCore/PingEntries.hpp"
#include "Svc/Subtopologies/CdhCore/SubtopologyTopologyDefs.hpp"
#include "Svc/Subtopologies/CdhCore/CdhCoreConfig/FppConstantsAc.hpp"
#include "Svc/Subtopologies/ComFprime/Ports_ComBufferQueueEnumAc.hpp"
#include "Svc/Subtopologies/ComFprime/Ports_ComPacketQueueEnumAc.hpp"
#include "Svc/Subtopologies/ComFprime/ComFprimeConfig/FppConstantsAc.hpp"
#include "Svc/Subtopologies/ComFprime/SubtopologyTopologyDefs.hpp"

namespace CropAdvisorApp {
struct TopologyState {
    const char* gdsHostname;
    U16 gdsPort;
    const char* requestSocket;
    const char* replayPath;
    const CropAdvisor::AdvisorConfig* advisorConfig;
    CdhCore::SubtopologyState cdhCore;
    ComFprime::SubtopologyState comFprime;
};

namespace ConfigObjects {
namespace CdhCore_health {
extern Svc::HealthImpl::PingEntry pingEntries[3];
}
}  // namespace ConfigObjects
}  // namespace CropAdvisorApp
