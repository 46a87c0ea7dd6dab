#pragma once
// tools/townlife_sim/DemoWorld.hpp
#include "townlife/sim/SimulationEngine.hpp"

namespace townlife::demo {

// Three linked maps (town, cafe, home), two characters and one NPC.
sim::WorldSetup MakeDemoWorld();

} // namespace townlife::demo
