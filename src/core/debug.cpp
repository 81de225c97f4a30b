#include "asteroids/core/debug.hpp"

// Initialize static members
int DebugStats::bullet_hits = 0;
int DebugStats::ship_hits = 0;
int DebugStats::fragments_spawned = 0;
int DebugStats::power_ups_dropped = 0;
int DebugStats::pickups = 0;
int DebugStats::waves_spawned = 0;
