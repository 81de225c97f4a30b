/**
 * @file lifetime.hpp
 * @brief System that ages short-lived entities
 *
 * Bullets and power-ups lose one tick of ttl per update and are marked Dead
 * once it reaches zero.
 */

#ifndef ASTEROIDS_LIFETIME_HPP
#define ASTEROIDS_LIFETIME_HPP

#include <entt/entt.hpp>
#include "asteroids/systems/i_system.hpp"

namespace Systems {

class LifetimeSystem : public ISystem {
public:
    LifetimeSystem() = default;
    ~LifetimeSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;
};

} // namespace Systems

#endif // ASTEROIDS_LIFETIME_HPP
