/**
 * @file game_session.hpp
 * @brief One game from first wave to game over: owns the ECS registry and steps it.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "asteroids/components/session.hpp"
#include "asteroids/core/game_config.hpp"
#include "asteroids/core/input_intents.hpp"
#include "asteroids/core/snapshot.hpp"
#include "asteroids/systems/i_system.hpp"
#include "asteroids/systems/wave.hpp"

/**
 * @class GameSession
 * @brief Owns every entity of a game and advances them one tick at a time.
 *
 * All mutable game state lives in the session's registry; nothing outside
 * the session holds entity handles. Randomness comes from a std::mt19937
 * seeded with GameConfig::seed, so two sessions with the same configuration
 * and the same intent/dt sequence stay identical.
 */
class GameSession {
public:
    /**
     * @brief Validates the configuration, spawns the ship and the first wave.
     * @throws InvalidConfiguration if the configuration is unusable
     */
    explicit GameSession(const GameConfig& config);

    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Simulates one tick.
     *
     * dt is clamped into [0, maxTickSeconds]. A zero-length step and any step
     * outside the Playing state leave the session untouched.
     *
     * @param intents Player input sampled for this tick
     * @param dt Elapsed seconds reported by the clock
     */
    void advance(const InputIntents& intents, double dt);

    /**
     * @brief Playing -> Paused. Other states are left alone.
     */
    void pause();

    /**
     * @brief Paused -> Playing. Other states are left alone.
     */
    void resume();

    /**
     * @brief Read-only copy of everything a renderer draws.
     */
    RenderSnapshot snapshot() const;

    int score() const;
    int wave() const;
    int lives() const;
    std::uint64_t tick() const;
    Components::GameState state() const;
    const Components::SessionStats& stats() const;
    const GameConfig& config() const { return cfg; }

    /**
     * @brief Access to the ECS registry
     */
    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    void createSystems();

    GameConfig cfg;
    entt::registry registry;
    std::mt19937 rng;
    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::WaveSystem* waveSystem = nullptr;
};
