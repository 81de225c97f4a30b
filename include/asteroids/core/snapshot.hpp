/**
 * @file snapshot.hpp
 * @brief Read-only view of a session handed to the renderer.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "asteroids/components/basic.hpp"
#include "asteroids/components/game.hpp"
#include "asteroids/components/session.hpp"

/**
 * @brief One drawable entity.
 *
 * tier is only meaningful for asteroids, powerUp only for power-ups,
 * invulnerable and thrusting only for the ship.
 */
struct EntitySnapshot {
    std::uint64_t id = 0;
    Components::EntityKind kind = Components::EntityKind::Asteroid;
    Position position;
    double heading = 0.0;
    double radius = 0.0;
    Components::AsteroidTier tier = Components::AsteroidTier::Large;
    Components::PowerUpType powerUp = Components::PowerUpType::Ammo;
    bool invulnerable = false;
    bool thrusting = false;
};

/**
 * @brief Everything the renderer needs for one frame, entities in id order.
 */
struct RenderSnapshot {
    std::vector<EntitySnapshot> entities;
    int score = 0;
    int lives = 0;
    int wave = 0;
    int ammo = 0;
    int highScore = 0;
    std::uint64_t tick = 0;
    Components::GameState state = Components::GameState::Playing;
    Components::SessionStats stats;
};
