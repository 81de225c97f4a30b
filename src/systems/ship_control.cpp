#include "asteroids/systems/ship_control.hpp"
#include "asteroids/components/basic.hpp"
#include "asteroids/components/game.hpp"
#include "asteroids/core/profile.hpp"
#include "asteroids/entities/entity_factory.hpp"
#include <algorithm>
#include <cmath>

namespace Systems {

void ShipControlSystem::setGameConfig(const GameConfig& cfg) {
    config = cfg;
}

int ShipControlSystem::cooldownAfterShot(bool rapidFire) const {
    if (!rapidFire) {
        return config.ship.fireCooldownTicks;
    }
    double const scaled = config.ship.fireCooldownTicks * config.powerUps.rapidFireCooldownFactor;
    return std::max(1, static_cast<int>(std::lround(scaled)));
}

void ShipControlSystem::update(entt::registry& registry, TickContext& ctx) {
    PROFILE_SCOPE("ShipControlSystem");

    // Bullets are spawned below, so work on the single ship outside of a view loop
    entt::entity const shipEntity = Entities::findShip(registry);
    if (shipEntity == entt::null) {
        return;
    }

    auto& ship = registry.get<Components::Ship>(shipEntity);
    auto& vel = registry.get<Components::Velocity>(shipEntity);
    auto& heading = registry.get<Components::Heading>(shipEntity);
    const auto pos = registry.get<Components::Position>(shipEntity);
    const double radius = registry.get<Components::Radius>(shipEntity).value;
    const InputIntents& in = ctx.intents;

    if (ship.fireCooldown > 0) {
        --ship.fireCooldown;
    }

    if (config.ammo.enabled) {
        if (ship.ammo < config.ammo.max) {
            if (++ship.ammoRechargeTimer >= config.ammo.rechargeIntervalTicks) {
                ship.ammoRechargeTimer = 0;
                ship.ammo = std::min(ship.ammo + config.ammo.rechargeAmount, config.ammo.max);
            }
        } else {
            ship.ammoRechargeTimer = 0;
        }
    }

    // Screen y grows downward, so turning left decreases the heading
    if (in.rotateLeft) {
        heading.angle -= config.ship.angularSpeed * ctx.dt;
    } else if (in.rotateRight) {
        heading.angle += config.ship.angularSpeed * ctx.dt;
    }
    heading.angle = std::remainder(heading.angle, 2.0 * GameConstants::Pi);

    const Vector forward = Vector::fromAngle(heading.angle);

    ship.thrusting = in.thrust;
    if (in.thrust) {
        vel = (vel + forward * (config.ship.thrustAccel * ctx.dt)).clampLength(config.ship.maxSpeed);
    }

    if (!in.fire || ship.fireCooldown > 0) {
        return;
    }
    if (config.ammo.enabled && ship.ammo <= 0) {
        return;
    }

    if (config.ammo.enabled) {
        --ship.ammo;
    }
    ship.fireCooldown = cooldownAfterShot(ship.hasRapidFire(ctx.tick));

    // ship, vel and heading may dangle once the factory grows the pools
    const Vector bulletVel = vel + forward * config.bullet.speed;
    const double bulletHeading = heading.angle;
    Entities::EntityFactory::createBullet(registry, config.bullet, pos + forward * radius,
                                          bulletVel, bulletHeading);

    Entities::sessionState(registry).stats.shotsFired++;
}

} // namespace Systems
