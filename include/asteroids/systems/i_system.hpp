/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems of the game core
 */

#pragma once

#include <cstdint>
#include <random>

#include <entt/entt.hpp>

#include "asteroids/core/game_config.hpp"
#include "asteroids/core/input_intents.hpp"

namespace Systems {

/**
 * @struct TickContext
 * @brief Per-tick inputs shared by every system
 *
 * The random engine belongs to the session; systems draw from it in a fixed
 * order so that equal seeds replay identically.
 */
struct TickContext {
    double dt;                  ///< Clamped step length in seconds
    const InputIntents& intents;
    std::uint64_t tick;         ///< Index of the tick being simulated
    std::mt19937& rng;
};

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Systems run in a fixed order once per tick. They only mutate the registry
 * they are given and never keep entity handles between ticks.
 */
class ISystem {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     * @param ctx Step length, intents and random source for this tick
     */
    virtual void update(entt::registry& registry, TickContext& ctx) = 0;

    /**
     * @brief Sets the game configuration
     *
     * @param config Tuning parameters of the owning session
     */
    virtual void setGameConfig(const GameConfig& config) = 0;
};

} // namespace Systems
