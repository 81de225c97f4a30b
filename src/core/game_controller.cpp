/**
 * @file game_controller.cpp
 * @brief Implementation of GameController.
 */

#include "asteroids/core/game_controller.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

GameController::GameController(const GameConfig& config, std::string playerName)
    : baseConfig(config)
    , current(std::make_unique<GameSession>(config))
    , highScoreTable()
    , playerName(std::move(playerName))
{
}

void GameController::update(const InputIntents& intents, double dt)
{
    if (!running) {
        return;
    }

    if (intents.quit) {
        quit();
        return;
    }
    if (intents.restart) {
        restart();
        return;
    }

    switch (current->state()) {
        case Components::GameState::Playing:
            if (intents.pause) {
                togglePause();
                return;
            }
            current->advance(intents, dt);
            if (current->state() == Components::GameState::GameOver) {
                recordGameOver();
            }
            break;
        case Components::GameState::Paused:
            if (intents.pause) {
                togglePause();
            }
            break;
        case Components::GameState::GameOver:
            break;
    }
}

void GameController::togglePause()
{
    switch (current->state()) {
        case Components::GameState::Playing:
            current->pause();
            std::cout << "[GameController] Paused" << std::endl;
            break;
        case Components::GameState::Paused:
            current->resume();
            std::cout << "[GameController] Resumed" << std::endl;
            break;
        case Components::GameState::GameOver:
            break;
    }
}

void GameController::restart()
{
    ++restarts;
    GameConfig next = baseConfig;
    next.seed = baseConfig.seed + static_cast<std::uint32_t>(restarts);

    current = std::make_unique<GameSession>(next);
    gameOverRecorded = false;
    std::cout << "[GameController] Restarted (" << restarts << ")" << std::endl;
}

void GameController::quit()
{
    running = false;
    std::cout << "[GameController] Quit" << std::endl;
}

Components::GameState GameController::state() const
{
    return current->state();
}

RenderSnapshot GameController::snapshot() const
{
    RenderSnapshot snap = current->snapshot();
    snap.highScore = std::max(highScoreTable.best(), snap.score);
    return snap;
}

void GameController::recordGameOver()
{
    if (gameOverRecorded) {
        return;
    }
    gameOverRecorded = true;

    int const rank = highScoreTable.record(playerName, current->score(), current->wave());
    if (rank >= 0) {
        std::cout << "[GameController] New high score #" << rank + 1 << ": "
                  << current->score() << std::endl;
    }
}
