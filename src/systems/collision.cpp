#include "asteroids/systems/collision.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/components/session.hpp"
#include "asteroids/core/constants.hpp"
#include "asteroids/core/debug.hpp"
#include "asteroids/core/profile.hpp"
#include "asteroids/entities/entity_factory.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace Systems {

namespace {

bool byId(const CollisionBody& a, const CollisionBody& b) {
    return a.id < b.id;
}

CollisionBody bodyOf(const entt::registry& registry, entt::entity entity) {
    return CollisionBody{
        registry.get<Components::EntityId>(entity).value,
        registry.get<Components::Position>(entity),
        registry.get<Components::Radius>(entity).value
    };
}

} // namespace

bool overlaps(const CollisionBody& a, const CollisionBody& b, double width, double height) {
    double const reach = a.radius + b.radius;
    Vector const d = toroidalDelta(a.position, b.position, width, height);
    return d.lengthSquared() <= reach * reach;
}

CollisionResult findCollisions(std::vector<CollisionBody> asteroids,
                               std::vector<CollisionBody> bullets,
                               const CollisionBody* ship,
                               std::vector<CollisionBody> powerUps,
                               double width,
                               double height) {
    std::sort(asteroids.begin(), asteroids.end(), byId);
    std::sort(bullets.begin(), bullets.end(), byId);
    std::sort(powerUps.begin(), powerUps.end(), byId);

    CollisionResult result;
    std::vector<bool> claimed(asteroids.size(), false);

    for (const auto& bullet : bullets) {
        for (std::size_t i = 0; i < asteroids.size(); ++i) {
            if (claimed[i] || !overlaps(bullet, asteroids[i], width, height)) {
                continue;
            }
            claimed[i] = true;
            result.bulletHits.emplace_back(bullet.id, asteroids[i].id);
            break;
        }
    }

    if (ship == nullptr) {
        return result;
    }

    for (std::size_t i = 0; i < asteroids.size(); ++i) {
        if (!claimed[i] && overlaps(*ship, asteroids[i], width, height)) {
            result.shipHits.push_back(asteroids[i].id);
        }
    }

    for (const auto& powerUp : powerUps) {
        if (overlaps(*ship, powerUp, width, height)) {
            result.pickups.push_back(powerUp.id);
        }
    }

    return result;
}

int scoreForTier(Components::AsteroidTier tier) {
    switch (tier) {
        case Components::AsteroidTier::Large:  return GameConstants::ScoreLargeAsteroid;
        case Components::AsteroidTier::Medium: return GameConstants::ScoreMediumAsteroid;
        case Components::AsteroidTier::Small:  return GameConstants::ScoreSmallAsteroid;
    }
    return 0;
}

void CollisionSystem::setGameConfig(const GameConfig& cfg) {
    config = cfg;
}

void CollisionSystem::splitAsteroid(const Position& position,
                                    const Vector& velocity,
                                    Components::AsteroidTier tier,
                                    double radius,
                                    std::mt19937& rng,
                                    std::vector<Fragment>& out) const {
    Components::AsteroidTier childTier;
    if (!Components::smallerTier(tier, childTier)) {
        return;
    }

    const AsteroidConfig& ast = config.asteroids;
    std::uniform_real_distribution<double> angleDist(
        GameConstants::degreesToRadians(ast.splitAngleMinDegrees),
        GameConstants::degreesToRadians(ast.splitAngleMaxDegrees));
    double const spread = angleDist(rng);

    Vector direction;
    if (velocity.length() > EPSILON) {
        direction = velocity.normalized();
    } else {
        std::uniform_real_distribution<double> headingDist(0.0, 2.0 * GameConstants::Pi);
        direction = Vector::fromAngle(headingDist(rng));
    }
    double const speed = std::max(velocity.length(), ast.minSpeed) * ast.splitSpeedFactor;
    double const childRadius = radius * 0.5;

    out.push_back({position, direction.rotateByAngle(spread) * speed, childTier, childRadius});
    out.push_back({position, direction.rotateByAngle(-spread) * speed, childTier, childRadius});
}

void CollisionSystem::respawnShip(entt::registry& registry,
                                  entt::entity shipEntity,
                                  std::uint64_t tick) const {
    registry.replace<Components::Position>(shipEntity,
        config.screenWidth * 0.5, config.screenHeight * 0.5);
    registry.replace<Components::Velocity>(shipEntity, 0.0, 0.0);
    registry.replace<Components::Heading>(shipEntity, config.ship.spawnHeading);

    auto& ship = registry.get<Components::Ship>(shipEntity);
    ship.invulnerableUntil = tick + static_cast<std::uint64_t>(config.ship.invulnerabilityTicks);
    ship.thrusting = false;
}

void CollisionSystem::applyPowerUp(Components::Ship& ship,
                                   Components::PowerUpType type,
                                   std::uint64_t tick) const {
    const PowerUpConfig& pu = config.powerUps;
    switch (type) {
        case Components::PowerUpType::Ammo:
            if (config.ammo.enabled) {
                ship.ammo = std::min(ship.ammo + pu.ammoAmount, config.ammo.max);
            }
            break;
        case Components::PowerUpType::RapidFire:
            ship.rapidFireUntil = tick + static_cast<std::uint64_t>(pu.rapidFireTicks);
            break;
        case Components::PowerUpType::Shield:
            ship.invulnerableUntil = std::max(ship.invulnerableUntil,
                                              tick + static_cast<std::uint64_t>(pu.shieldTicks));
            break;
    }
}

void CollisionSystem::update(entt::registry& registry, TickContext& ctx) {
    PROFILE_SCOPE("CollisionSystem");

    std::unordered_map<std::uint64_t, entt::entity> byEntityId;
    std::vector<CollisionBody> asteroids;
    std::vector<CollisionBody> bullets;
    std::vector<CollisionBody> powerUps;

    auto kinds = registry.view<const Components::Kind>(entt::exclude<Components::Dead>);
    for (auto [entity, kind] : kinds.each()) {
        CollisionBody const body = bodyOf(registry, entity);
        switch (kind.value) {
            case Components::EntityKind::Asteroid: asteroids.push_back(body); break;
            case Components::EntityKind::Bullet:   bullets.push_back(body);   break;
            case Components::EntityKind::PowerUp:  powerUps.push_back(body);  break;
            case Components::EntityKind::Ship:     continue;
        }
        byEntityId.emplace(body.id, entity);
    }

    entt::entity const shipEntity = Entities::findShip(registry);
    CollisionBody shipBody{};
    if (shipEntity != entt::null) {
        shipBody = bodyOf(registry, shipEntity);
    }

    CollisionResult const result = findCollisions(
        std::move(asteroids), std::move(bullets),
        shipEntity != entt::null ? &shipBody : nullptr,
        std::move(powerUps), config.screenWidth, config.screenHeight);

    auto& session = Entities::sessionState(registry);
    std::vector<Fragment> fragments;
    std::vector<std::pair<Position, Components::PowerUpType>> drops;
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<int> powerUpKind(0, 2);

    for (const auto& [bulletId, asteroidId] : result.bulletHits) {
        entt::entity const bullet = byEntityId.at(bulletId);
        entt::entity const asteroid = byEntityId.at(asteroidId);

        const auto tier = registry.get<Components::Asteroid>(asteroid).tier;
        const auto& pos = registry.get<Components::Position>(asteroid);
        const auto& vel = registry.get<Components::Velocity>(asteroid);
        const double radius = registry.get<Components::Radius>(asteroid).value;

        session.score += scoreForTier(tier);
        session.stats.asteroidsDestroyed++;

        std::size_t const before = fragments.size();
        splitAsteroid(pos, vel, tier, radius, ctx.rng, fragments);
        DebugStats::recordBulletHit(static_cast<int>(fragments.size() - before));

        if (config.powerUps.enabled && unit(ctx.rng) < config.powerUps.spawnChance) {
            drops.emplace_back(pos, static_cast<Components::PowerUpType>(powerUpKind(ctx.rng)));
        }

        registry.emplace_or_replace<Components::Dead>(bullet);
        registry.emplace_or_replace<Components::Dead>(asteroid);
    }

    if (shipEntity != entt::null) {
        auto& ship = registry.get<Components::Ship>(shipEntity);
        bool shipHit = false;

        if (!result.shipHits.empty() && !ship.isInvulnerable(ctx.tick)) {
            shipHit = true;
            ship.lives -= 1;
            session.stats.livesLost++;
            DebugStats::recordShipHit();
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Collision] Ship hit at tick " << ctx.tick
                      << ", lives left " << ship.lives << "\n");

            respawnShip(registry, shipEntity, ctx.tick);
            if (ship.lives < 0) {
                session.state = Components::GameState::GameOver;
            }
        }

        // Pickups were detected at the position the ship died at
        if (!shipHit) {
            for (std::uint64_t id : result.pickups) {
                entt::entity const powerUp = byEntityId.at(id);
                applyPowerUp(ship, registry.get<Components::PowerUp>(powerUp).type, ctx.tick);
                registry.emplace_or_replace<Components::Dead>(powerUp);
                session.stats.powerUpsCollected++;
                DebugStats::recordPickup();
            }
        }
    }

    // Fragments and drops are created last so no reference above is invalidated
    for (const auto& f : fragments) {
        Entities::EntityFactory::createAsteroid(registry, f.position, f.velocity, f.tier, f.radius);
    }

    std::uniform_real_distribution<double> driftDist(0.0, 2.0 * GameConstants::Pi);
    for (const auto& [pos, type] : drops) {
        Vector const drift = Vector::fromAngle(driftDist(ctx.rng)) * config.powerUps.driftSpeed;
        Entities::EntityFactory::createPowerUp(registry, config.powerUps, pos, drift, type);
        DebugStats::recordPowerUpDrop();
    }
}

} // namespace Systems
