/**
 * @file movement.hpp
 * @brief System for integrating positions on the toroidal playfield
 *
 * This system handles:
 * - Position updates using velocity
 * - Wrapping positions back into [0,width) x [0,height)
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 */

#ifndef ASTEROIDS_MOVEMENT_HPP
#define ASTEROIDS_MOVEMENT_HPP

#include <entt/entt.hpp>
#include "asteroids/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Moves every entity by velocity * dt, exiting one edge re-enters the opposite one
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;

private:
    double width = GameConstants::ScreenWidth;
    double height = GameConstants::ScreenHeight;
};

} // namespace Systems

#endif // ASTEROIDS_MOVEMENT_HPP
