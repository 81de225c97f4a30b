/**
 * @file game_config.hpp
 * @brief Tuning parameters for a game session.
 */

#pragma once

#include <cstdint>

#include "asteroids/core/constants.hpp"

/**
 * @struct ShipConfig
 * @brief Handling and survivability of the player ship
 */
struct ShipConfig {
    double radius = 15.0;              // Collision radius (pixels)
    double angularSpeed = 3.5;         // Turn rate (radians per second)
    double thrustAccel = 300.0;        // Acceleration while thrusting (pixels/s^2)
    double maxSpeed = 400.0;           // Speed cap applied by thrust (pixels/s)
    double spawnHeading = 0.0;         // Heading on spawn and respawn (radians)
    int initialLives = 3;              // Game ends when lives drop below zero
    int invulnerabilityTicks = 180;    // Grace window after a respawn
    int fireCooldownTicks = 10;        // Minimum ticks between shots
};

/**
 * @struct BulletConfig
 */
struct BulletConfig {
    double radius = 2.0;
    double speed = 500.0;              // Added to the ship velocity along the heading
    int ttlTicks = 60;
};

/**
 * @struct AsteroidConfig
 * @brief Wave composition and asteroid motion
 *
 * Medium and Small radii are derived by halving: a Large asteroid of radius 40
 * splits into Medium 20, which splits into Small 10.
 */
struct AsteroidConfig {
    int initialCount = 4;              // Wave n spawns initialCount + n Large asteroids
    double largeRadius = 40.0;
    double minSpeed = 30.0;
    double maxSpeed = 90.0;
    double splitAngleMinDegrees = 20.0;
    double splitAngleMaxDegrees = 50.0;
    double splitSpeedFactor = 1.2;     // Children move faster than the parent
    double safeSpawnRadius = 150.0;    // Keep-out radius around the ship spawn point
    int maxSpawnAttempts = 32;         // Rejection sampling budget per asteroid
};

/**
 * @struct AmmoConfig
 * @brief Limited ammunition that recharges over time
 */
struct AmmoConfig {
    bool enabled = true;
    int initial = 25;
    int max = 80;
    int rechargeIntervalTicks = 120;
    int rechargeAmount = 3;
};

/**
 * @struct PowerUpConfig
 * @brief Pickups dropped by asteroids destroyed with bullets
 */
struct PowerUpConfig {
    bool enabled = true;
    double spawnChance = 0.3;
    double radius = 10.0;
    double driftSpeed = 15.0;
    int lifetimeTicks = 600;
    int ammoAmount = 5;
    int rapidFireTicks = 300;
    double rapidFireCooldownFactor = 0.3;  // Lower is faster
    int shieldTicks = 240;
};

/**
 * @struct GameConfig
 * @brief Holds all tuning parameters for one session.
 */
struct GameConfig {
    double screenWidth = GameConstants::ScreenWidth;
    double screenHeight = GameConstants::ScreenHeight;
    double maxTickSeconds = GameConstants::MaxTickSeconds;
    std::uint32_t seed = 1;

    ShipConfig ship;
    BulletConfig bullet;
    AsteroidConfig asteroids;
    AmmoConfig ammo;
    PowerUpConfig powerUps;
};

/**
 * @brief Checks every parameter of a configuration.
 *
 * @param cfg Configuration to check
 * @throws InvalidConfiguration naming the first offending parameter
 */
void validateConfig(const GameConfig& cfg);

/**
 * @brief Builds the default configuration adjusted for a difficulty level.
 *
 * EASY slows asteroids and grants an extra life, HARD speeds them up,
 * adds two asteroids per wave and removes a life.
 */
GameConfig configForDifficulty(GameConstants::Difficulty difficulty);
