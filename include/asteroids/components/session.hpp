#pragma once

#include <cstdint>

namespace Components {

    enum class GameState {
        Playing,
        Paused,
        GameOver
    };

    struct SessionStats {
        int shotsFired = 0;
        int asteroidsDestroyed = 0;   // Bullet kills only
        int livesLost = 0;
        int powerUpsCollected = 0;
        double timeSurvived = 0.0;    // Seconds of simulated play
    };

    /**
     * @brief Session-wide state, stored on a single entity in the registry.
     */
    struct SessionState {
        int score = 0;
        int wave = 0;
        GameState state = GameState::Playing;
        std::uint64_t tick = 0;
        std::uint64_t nextEntityId = 1;
        SessionStats stats;
    };
}
