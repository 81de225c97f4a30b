#include "asteroids/systems/wave.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/components/session.hpp"
#include "asteroids/core/debug.hpp"
#include "asteroids/core/profile.hpp"
#include "asteroids/entities/entity_factory.hpp"

#include <iostream>

namespace Systems {

void WaveSystem::setGameConfig(const GameConfig& cfg) {
    config = cfg;
}

Position WaveSystem::pickSpawnPosition(const Position& shipPosition, std::mt19937& rng) const {
    const double w = config.screenWidth;
    const double h = config.screenHeight;
    const double band = config.asteroids.largeRadius;
    const double safe = config.asteroids.safeSpawnRadius;
    const Position spawnPoint(w * 0.5, h * 0.5);

    std::uniform_int_distribution<int> edgeDist(0, 3);
    std::uniform_real_distribution<double> alongX(0.0, w);
    std::uniform_real_distribution<double> alongY(0.0, h);
    std::uniform_real_distribution<double> across(0.0, band);

    Position candidate;
    for (int attempt = 0; attempt < config.asteroids.maxSpawnAttempts; ++attempt) {
        switch (edgeDist(rng)) {
            case 0: candidate = Position(alongX(rng), across(rng)); break;          // top
            case 1: candidate = Position(alongX(rng), h - band + across(rng)); break; // bottom
            case 2: candidate = Position(across(rng), alongY(rng)); break;          // left
            default: candidate = Position(w - band + across(rng), alongY(rng)); break; // right
        }
        candidate = wrapPosition(candidate, w, h);

        // The edge band always clears the spawn point for a validated config;
        // the ship may be anywhere, so that check can fail and is retried.
        if (toroidalDistance(candidate, spawnPoint, w, h) >= safe &&
            toroidalDistance(candidate, shipPosition, w, h) >= safe) {
            return candidate;
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Wave] Spawn attempts exhausted, placing asteroid near the ship\n");
    return candidate;
}

int WaveSystem::startNextWave(entt::registry& registry, std::mt19937& rng) const {
    auto& session = Entities::sessionState(registry);
    session.wave += 1;
    const int wave = session.wave;
    const int count = config.asteroids.initialCount + wave;

    Position shipPosition(config.screenWidth * 0.5, config.screenHeight * 0.5);
    entt::entity const ship = Entities::findShip(registry);
    if (ship != entt::null) {
        shipPosition = registry.get<Components::Position>(ship);
    }

    std::uniform_real_distribution<double> headingDist(0.0, 2.0 * GameConstants::Pi);
    std::uniform_real_distribution<double> speedDist(config.asteroids.minSpeed,
                                                     config.asteroids.maxSpeed);

    for (int i = 0; i < count; ++i) {
        Position const pos = pickSpawnPosition(shipPosition, rng);
        Vector const vel = Vector::fromAngle(headingDist(rng)) * speedDist(rng);
        Entities::EntityFactory::createAsteroid(registry, pos, vel,
                                                Components::AsteroidTier::Large,
                                                config.asteroids.largeRadius);
    }

    DebugStats::recordWave();
    std::cout << "[Wave] Wave " << wave << ": " << count << " asteroids" << std::endl;
    return count;
}

void WaveSystem::update(entt::registry& registry, TickContext& ctx) {
    PROFILE_SCOPE("WaveSystem");

    if (Entities::sessionState(registry).state != Components::GameState::Playing) {
        return;
    }
    if (Entities::countAsteroids(registry) > 0) {
        return;
    }
    startNextWave(registry, ctx.rng);
}

} // namespace Systems
