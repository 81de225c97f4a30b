#include "asteroids/systems/lifetime.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/components/game.hpp"
#include "asteroids/core/profile.hpp"

#include <vector>

namespace Systems {

void LifetimeSystem::setGameConfig(const GameConfig& /*config*/) {
    // ttl values are stamped by the entity factory
}

void LifetimeSystem::update(entt::registry& registry, TickContext& /*ctx*/) {
    PROFILE_SCOPE("LifetimeSystem");

    std::vector<entt::entity> expired;

    auto bullets = registry.view<Components::Bullet>(entt::exclude<Components::Dead>);
    for (auto [entity, bullet] : bullets.each()) {
        if (--bullet.ttl <= 0) {
            expired.push_back(entity);
        }
    }

    auto powerUps = registry.view<Components::PowerUp>(entt::exclude<Components::Dead>);
    for (auto [entity, powerUp] : powerUps.each()) {
        if (--powerUp.ttl <= 0) {
            expired.push_back(entity);
        }
    }

    // Tagging inside the loops would modify the Dead pool the views exclude on
    for (auto entity : expired) {
        registry.emplace_or_replace<Components::Dead>(entity);
    }
}

} // namespace Systems
