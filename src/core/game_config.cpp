/**
 * @file game_config.cpp
 * @brief Validation and difficulty presets for GameConfig.
 */

#include "asteroids/core/game_config.hpp"

#include <algorithm>
#include <sstream>

#include "asteroids/core/errors.hpp"

namespace {

void require(bool condition, const char* what) {
  if (!condition) {
    throw InvalidConfiguration(what);
  }
}

}  // namespace

void validateConfig(const GameConfig& cfg) {
  require(cfg.screenWidth > 0.0, "screenWidth must be positive");
  require(cfg.screenHeight > 0.0, "screenHeight must be positive");
  require(cfg.maxTickSeconds > 0.0, "maxTickSeconds must be positive");

  const ShipConfig& ship = cfg.ship;
  require(ship.radius > 0.0, "ship.radius must be positive");
  require(ship.angularSpeed >= 0.0, "ship.angularSpeed must not be negative");
  require(ship.thrustAccel >= 0.0, "ship.thrustAccel must not be negative");
  require(ship.maxSpeed > 0.0, "ship.maxSpeed must be positive");
  require(ship.initialLives >= 0, "ship.initialLives must not be negative");
  require(ship.invulnerabilityTicks >= 0, "ship.invulnerabilityTicks must not be negative");
  require(ship.fireCooldownTicks > 0, "ship.fireCooldownTicks must be positive");

  require(cfg.bullet.radius > 0.0, "bullet.radius must be positive");
  require(cfg.bullet.speed > 0.0, "bullet.speed must be positive");
  require(cfg.bullet.ttlTicks > 0, "bullet.ttlTicks must be positive");

  const AsteroidConfig& ast = cfg.asteroids;
  require(ast.initialCount > 0, "asteroids.initialCount must be positive");
  require(ast.largeRadius > 0.0, "asteroids.largeRadius must be positive");
  require(ast.minSpeed > 0.0, "asteroids.minSpeed must be positive");
  require(ast.maxSpeed >= ast.minSpeed, "asteroids.maxSpeed must be at least minSpeed");
  require(ast.splitAngleMinDegrees <= ast.splitAngleMaxDegrees,
          "asteroids.splitAngleMinDegrees must not exceed splitAngleMaxDegrees");
  require(ast.splitSpeedFactor > 0.0, "asteroids.splitSpeedFactor must be positive");
  require(ast.safeSpawnRadius >= 0.0, "asteroids.safeSpawnRadius must not be negative");
  require(ast.maxSpawnAttempts > 0, "asteroids.maxSpawnAttempts must be positive");

  // Asteroids spawn in an edge band one radius wide; the band has to clear
  // the keep-out circle around the screen centre.
  double const halfExtent = std::min(cfg.screenWidth, cfg.screenHeight) * 0.5;
  if (ast.safeSpawnRadius + ast.largeRadius >= halfExtent) {
    std::ostringstream oss;
    oss << "asteroids.safeSpawnRadius + largeRadius (" << ast.safeSpawnRadius + ast.largeRadius
        << ") must be below half the shorter screen side (" << halfExtent << ")";
    throw InvalidConfiguration(oss.str());
  }

  if (cfg.ammo.enabled) {
    require(cfg.ammo.max > 0, "ammo.max must be positive");
    require(cfg.ammo.initial >= 0 && cfg.ammo.initial <= cfg.ammo.max,
            "ammo.initial must be within [0, ammo.max]");
    require(cfg.ammo.rechargeIntervalTicks > 0, "ammo.rechargeIntervalTicks must be positive");
    require(cfg.ammo.rechargeAmount >= 0, "ammo.rechargeAmount must not be negative");
  }

  if (cfg.powerUps.enabled) {
    const PowerUpConfig& pu = cfg.powerUps;
    require(pu.spawnChance >= 0.0 && pu.spawnChance <= 1.0,
            "powerUps.spawnChance must be within [0, 1]");
    require(pu.radius > 0.0, "powerUps.radius must be positive");
    require(pu.driftSpeed >= 0.0, "powerUps.driftSpeed must not be negative");
    require(pu.lifetimeTicks > 0, "powerUps.lifetimeTicks must be positive");
    require(pu.ammoAmount >= 0, "powerUps.ammoAmount must not be negative");
    require(pu.rapidFireTicks >= 0, "powerUps.rapidFireTicks must not be negative");
    require(pu.rapidFireCooldownFactor > 0.0 && pu.rapidFireCooldownFactor <= 1.0,
            "powerUps.rapidFireCooldownFactor must be within (0, 1]");
    require(pu.shieldTicks >= 0, "powerUps.shieldTicks must not be negative");
  }
}

GameConfig configForDifficulty(GameConstants::Difficulty difficulty) {
  GameConfig cfg;
  switch (difficulty) {
    case GameConstants::Difficulty::EASY:
      cfg.asteroids.minSpeed *= 0.7;
      cfg.asteroids.maxSpeed *= 0.7;
      cfg.ship.initialLives = 4;
      break;
    case GameConstants::Difficulty::HARD:
      cfg.asteroids.minSpeed *= 1.3;
      cfg.asteroids.maxSpeed *= 1.3;
      cfg.asteroids.initialCount += 2;
      cfg.ship.initialLives = 2;
      break;
    case GameConstants::Difficulty::NORMAL:
    default:
      break;
  }
  return cfg;
}
