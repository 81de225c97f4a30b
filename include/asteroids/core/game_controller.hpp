/**
 * @file game_controller.hpp
 * @brief Top-level state machine over a GameSession.
 */

#pragma once

#include <memory>
#include <string>

#include "asteroids/core/game_config.hpp"
#include "asteroids/core/game_session.hpp"
#include "asteroids/core/high_scores.hpp"
#include "asteroids/core/input_intents.hpp"
#include "asteroids/core/snapshot.hpp"

/**
 * @class GameController
 * @brief Routes intents to the current session and handles pause, restart and quit.
 *
 * Transitions:
 * - Playing -> Paused and back on a pause intent
 * - Playing -> GameOver when the session runs out of lives
 * - any state -> Playing on a restart intent, which replaces the session
 *
 * While Paused or GameOver every intent other than pause/restart/quit is
 * ignored. After quit, update() does nothing.
 */
class GameController {
public:
    /**
     * @param config Configuration for every session this controller creates
     * @param playerName Name recorded in the high score table
     * @throws InvalidConfiguration if the configuration is unusable
     */
    explicit GameController(const GameConfig& config, std::string playerName = "PLAYER");

    /**
     * @brief Handles one frame of input and steps the session if playing.
     */
    void update(const InputIntents& intents, double dt);

    /**
     * @brief Toggles between Playing and Paused; no effect in GameOver.
     */
    void togglePause();

    /**
     * @brief Replaces the session with a fresh one seeded baseSeed + restartCount.
     */
    void restart();

    /**
     * @brief Stops the controller; later updates are ignored.
     */
    void quit();

    bool isRunning() const { return running; }
    Components::GameState state() const;
    int restartCount() const { return restarts; }

    /**
     * @brief Session snapshot with the session-wide high score filled in.
     */
    RenderSnapshot snapshot() const;

    GameSession& session() { return *current; }
    const GameSession& session() const { return *current; }
    const HighScoreTable& highScores() const { return highScoreTable; }

private:
    void recordGameOver();

    GameConfig baseConfig;
    std::unique_ptr<GameSession> current;
    HighScoreTable highScoreTable;
    std::string playerName;
    bool running = true;
    bool gameOverRecorded = false;
    int restarts = 0;
};
