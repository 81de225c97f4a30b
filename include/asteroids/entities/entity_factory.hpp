#pragma once

#include <entt/entt.hpp>

#include "asteroids/components/basic.hpp"
#include "asteroids/components/game.hpp"
#include "asteroids/components/session.hpp"
#include "asteroids/core/game_config.hpp"

namespace Entities {

/**
 * Factory for the entity kinds of a session.
 *
 * Every create method stamps a fresh EntityId taken from the registry's
 * SessionState, so a SessionState entity must exist before anything is spawned.
 */
class EntityFactory {
public:
    /**
     * Creates the singleton entity that carries Components::SessionState.
     */
    static entt::entity createSessionState(entt::registry& registry);

    static entt::entity createShip(
        entt::registry& registry,
        const GameConfig& config,
        const Components::Position& position
    );

    /**
     * Creates an asteroid. The radius is passed explicitly because fragments
     * take half of their parent's radius rather than a tier table value.
     */
    static entt::entity createAsteroid(
        entt::registry& registry,
        const Components::Position& position,
        const Components::Velocity& velocity,
        Components::AsteroidTier tier,
        double radius
    );

    static entt::entity createBullet(
        entt::registry& registry,
        const BulletConfig& config,
        const Components::Position& position,
        const Components::Velocity& velocity,
        double heading
    );

    static entt::entity createPowerUp(
        entt::registry& registry,
        const PowerUpConfig& config,
        const Components::Position& position,
        const Components::Velocity& velocity,
        Components::PowerUpType type
    );
};

/**
 * @brief Session state stored in the registry.
 * @throws std::logic_error if createSessionState was never called
 */
Components::SessionState& sessionState(entt::registry& registry);
const Components::SessionState& sessionState(const entt::registry& registry);

/**
 * @brief The live ship, or entt::null when there is none.
 */
entt::entity findShip(const entt::registry& registry);

/**
 * @brief Number of asteroids not marked Dead.
 */
std::size_t countAsteroids(const entt::registry& registry);

} // namespace Entities
