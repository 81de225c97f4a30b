#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef ASTEROIDS_ENABLE_DEBUG
#define ASTEROIDS_ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef ASTEROIDS_DEBUG_LEVEL
#define ASTEROIDS_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ASTEROIDS_ENABLE_DEBUG && level <= ASTEROIDS_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting gameplay event counts across a run
class DebugStats {
public:
    static void reset() {
        bullet_hits = 0;
        ship_hits = 0;
        fragments_spawned = 0;
        power_ups_dropped = 0;
        pickups = 0;
        waves_spawned = 0;
    }

    static void recordBulletHit(int fragments) {
        bullet_hits++;
        fragments_spawned += fragments;
    }

    static void recordShipHit() { ship_hits++; }
    static void recordPowerUpDrop() { power_ups_dropped++; }
    static void recordPickup() { pickups++; }
    static void recordWave() { waves_spawned++; }

    static int bulletHits() { return bullet_hits; }
    static int shipHits() { return ship_hits; }
    static int fragmentsSpawned() { return fragments_spawned; }

    static void printCollisionStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Collision stats:\n"
            "  Bullet hits: " << bullet_hits << "\n"
            "  Ship hits: " << ship_hits << "\n"
            "  Fragments spawned: " << fragments_spawned << "\n"
            "  Power-ups dropped/collected: " << power_ups_dropped << "/" << pickups << "\n"
            "  Waves spawned: " << waves_spawned << "\n"
        );
    }

private:
    static int bullet_hits;
    static int ship_hits;
    static int fragments_spawned;
    static int power_ups_dropped;
    static int pickups;
    static int waves_spawned;
};
