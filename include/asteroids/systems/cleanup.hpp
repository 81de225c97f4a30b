/**
 * @file cleanup.hpp
 * @brief System that destroys entities tagged Dead during the tick
 */

#ifndef ASTEROIDS_CLEANUP_HPP
#define ASTEROIDS_CLEANUP_HPP

#include <entt/entt.hpp>
#include "asteroids/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Runs after collision so that nothing is removed while another system scans
 */
class CleanupSystem : public ISystem {
public:
    CleanupSystem() = default;
    ~CleanupSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;
};

} // namespace Systems

#endif // ASTEROIDS_CLEANUP_HPP
