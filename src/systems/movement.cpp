#include "asteroids/systems/movement.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/core/profile.hpp"

namespace Systems {

void MovementSystem::setGameConfig(const GameConfig& config) {
    width = config.screenWidth;
    height = config.screenHeight;
}

void MovementSystem::update(entt::registry& registry, TickContext& ctx) {
    PROFILE_SCOPE("MovementSystem");

    auto view = registry.view<Components::Position, const Components::Velocity>(
        entt::exclude<Components::Dead>);

    for (auto [entity, pos, vel] : view.each()) {
        pos += vel * ctx.dt;
        pos = wrapPosition(pos, width, height);
    }
}

} // namespace Systems
