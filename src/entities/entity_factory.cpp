#include "asteroids/entities/entity_factory.hpp"

#include <cmath>
#include <stdexcept>

namespace Entities {

namespace {

std::uint64_t takeEntityId(entt::registry& registry) {
    auto& state = sessionState(registry);
    return state.nextEntityId++;
}

entt::entity createBody(entt::registry& registry,
                        Components::EntityKind kind,
                        const Components::Position& position,
                        const Components::Velocity& velocity,
                        double heading,
                        double radius) {
    std::uint64_t const id = takeEntityId(registry);

    auto entity = registry.create();
    registry.emplace<Components::Kind>(entity, kind);
    registry.emplace<Components::EntityId>(entity, id);
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Velocity>(entity, velocity);
    registry.emplace<Components::Heading>(entity, heading);
    registry.emplace<Components::Radius>(entity, radius);
    return entity;
}

} // namespace

entt::entity EntityFactory::createSessionState(entt::registry& registry) {
    auto entity = registry.create();
    registry.emplace<Components::SessionState>(entity);
    return entity;
}

entt::entity EntityFactory::createShip(entt::registry& registry,
                                       const GameConfig& config,
                                       const Components::Position& position) {
    auto entity = createBody(registry, Components::EntityKind::Ship, position,
                             Components::Velocity(), config.ship.spawnHeading,
                             config.ship.radius);

    auto& ship = registry.emplace<Components::Ship>(entity);
    ship.lives = config.ship.initialLives;
    ship.ammo = config.ammo.enabled ? config.ammo.initial : 0;
    return entity;
}

entt::entity EntityFactory::createAsteroid(entt::registry& registry,
                                           const Components::Position& position,
                                           const Components::Velocity& velocity,
                                           Components::AsteroidTier tier,
                                           double radius) {
    // Asteroids tumble visually, their heading follows the drift direction
    double const heading = std::atan2(velocity.y, velocity.x);
    auto entity = createBody(registry, Components::EntityKind::Asteroid, position,
                             velocity, heading, radius);
    registry.emplace<Components::Asteroid>(entity, tier);
    return entity;
}

entt::entity EntityFactory::createBullet(entt::registry& registry,
                                         const BulletConfig& config,
                                         const Components::Position& position,
                                         const Components::Velocity& velocity,
                                         double heading) {
    auto entity = createBody(registry, Components::EntityKind::Bullet, position,
                             velocity, heading, config.radius);
    registry.emplace<Components::Bullet>(entity, config.ttlTicks);
    return entity;
}

entt::entity EntityFactory::createPowerUp(entt::registry& registry,
                                          const PowerUpConfig& config,
                                          const Components::Position& position,
                                          const Components::Velocity& velocity,
                                          Components::PowerUpType type) {
    auto entity = createBody(registry, Components::EntityKind::PowerUp, position,
                             velocity, 0.0, config.radius);
    registry.emplace<Components::PowerUp>(entity, type, config.lifetimeTicks);
    return entity;
}

Components::SessionState& sessionState(entt::registry& registry) {
    auto view = registry.view<Components::SessionState>();
    if (view.empty()) {
        throw std::logic_error("registry has no SessionState entity");
    }
    return registry.get<Components::SessionState>(view.front());
}

const Components::SessionState& sessionState(const entt::registry& registry) {
    auto view = registry.view<const Components::SessionState>();
    if (view.empty()) {
        throw std::logic_error("registry has no SessionState entity");
    }
    return registry.get<Components::SessionState>(view.front());
}

entt::entity findShip(const entt::registry& registry) {
    auto view = registry.view<const Components::Ship>(entt::exclude<Components::Dead>);
    for (auto entity : view) {
        return entity;
    }
    return entt::null;
}

std::size_t countAsteroids(const entt::registry& registry) {
    auto view = registry.view<const Components::Asteroid>(entt::exclude<Components::Dead>);
    std::size_t count = 0;
    for ([[maybe_unused]] auto entity : view) {
        ++count;
    }
    return count;
}

} // namespace Entities
