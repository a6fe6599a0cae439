#pragma once

#include "AppTopologyDefs.hpp"
#include <Fw/Time/TimeInterval.hpp>

namespace CropAdvisorApp {
// Returns false, before any component starts, when the model cannot be loaded.
[[nodiscard]] bool setupTopology(const TopologyState& state);
void startRateGroups(const Fw::TimeInterval& interval);
void stopRateGroups();
void teardownTopology(const TopologyState& state);
}
