#include "asteroids/systems/cleanup.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/core/profile.hpp"

#include <vector>

namespace Systems {

void CleanupSystem::setGameConfig(const GameConfig& /*config*/) {}

void CleanupSystem::update(entt::registry& registry, TickContext& /*ctx*/) {
    PROFILE_SCOPE("CleanupSystem");

    auto view = registry.view<Components::Dead>();
    std::vector<entt::entity> dead(view.begin(), view.end());
    for (auto entity : dead) {
        registry.destroy(entity);
    }
}

} // namespace Systems
