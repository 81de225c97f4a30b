/**
 * @file ship_control.hpp
 * @brief System translating input intents into ship motion and shots
 *
 * This system handles:
 * - Fire cooldown countdown and ammunition recharge
 * - Rotation (left wins when both directions are requested)
 * - Thrust along the heading, capped at the ship's maximum speed
 * - Spawning bullets at the ship's nose
 *
 * Required components:
 * - Ship, Position, Velocity, Heading, Radius
 */

#ifndef ASTEROIDS_SHIP_CONTROL_HPP
#define ASTEROIDS_SHIP_CONTROL_HPP

#include <entt/entt.hpp>
#include "asteroids/systems/i_system.hpp"

namespace Systems {

class ShipControlSystem : public ISystem {
public:
    ShipControlSystem() = default;
    ~ShipControlSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;

    /**
     * @brief Cooldown applied after a shot at the given tick
     *
     * Rapid fire scales the configured cooldown down, never below one tick.
     */
    int cooldownAfterShot(bool rapidFire) const;

private:
    GameConfig config;
};

} // namespace Systems

#endif // ASTEROIDS_SHIP_CONTROL_HPP
