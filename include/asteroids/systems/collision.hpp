/**
 * @file collision.hpp
 * @brief Circle collision detection on the torus and its gameplay response
 *
 * Detection is a pure function over plain bodies so it can be tested without
 * a registry. The system gathers bodies from the registry, runs detection
 * once per tick after movement and applies the outcome:
 * - Bullet vs asteroid: both destroyed, score awarded, asteroid split
 * - Asteroid vs ship: one life lost, ship respawned at the centre
 * - Ship vs power-up: power-up collected and applied
 *
 * Detection is a naive O(n*m) pairwise test; entity counts stay in the tens.
 */

#ifndef ASTEROIDS_COLLISION_HPP
#define ASTEROIDS_COLLISION_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "asteroids/components/game.hpp"
#include "asteroids/math/vector_math.hpp"
#include "asteroids/systems/i_system.hpp"

namespace Systems {

/**
 * @struct CollisionBody
 * @brief Minimal circle used for overlap tests
 */
struct CollisionBody {
    std::uint64_t id;
    Position position;
    double radius;
};

/**
 * @struct CollisionResult
 * @brief Resolved contacts for one tick, every list in ascending id order
 */
struct CollisionResult {
    /// (bullet id, asteroid id); each bullet and each asteroid appears at most once
    std::vector<std::pair<std::uint64_t, std::uint64_t>> bulletHits;

    /// Asteroids touching the ship that no bullet destroyed this tick
    std::vector<std::uint64_t> shipHits;

    /// Power-ups touching the ship
    std::vector<std::uint64_t> pickups;
};

/**
 * @brief Circle overlap using the wrapped distance
 *
 * Touching circles (distance == r1 + r2) count as overlapping.
 */
bool overlaps(const CollisionBody& a, const CollisionBody& b, double width, double height);

/**
 * @brief Finds all contacts between the entity sets of one tick
 *
 * Bullets are processed in ascending id order. A bullet that overlaps several
 * asteroids resolves against the lowest-id asteroid not already claimed by an
 * earlier bullet, so exactly one asteroid is destroyed per bullet.
 *
 * @param asteroids Live asteroids
 * @param bullets Live bullets
 * @param ship The ship, or nullptr when there is none
 * @param powerUps Live power-ups
 * @param width Playfield width
 * @param height Playfield height
 */
CollisionResult findCollisions(std::vector<CollisionBody> asteroids,
                               std::vector<CollisionBody> bullets,
                               const CollisionBody* ship,
                               std::vector<CollisionBody> powerUps,
                               double width,
                               double height);

/**
 * @brief Points awarded for destroying an asteroid of the given tier
 */
int scoreForTier(Components::AsteroidTier tier);

/**
 * @class CollisionSystem
 * @brief Applies the gameplay consequences of CollisionResult
 *
 * Destroyed entities are only tagged Dead; fragments and power-ups created
 * here are fresh entities that take part in collisions from the next tick on.
 */
class CollisionSystem : public ISystem {
public:
    CollisionSystem() = default;
    ~CollisionSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;

private:
    struct Fragment {
        Position position;
        Vector velocity;
        Components::AsteroidTier tier;
        double radius;
    };

    void splitAsteroid(const Position& position,
                       const Vector& velocity,
                       Components::AsteroidTier tier,
                       double radius,
                       std::mt19937& rng,
                       std::vector<Fragment>& out) const;

    void respawnShip(entt::registry& registry, entt::entity shipEntity, std::uint64_t tick) const;

    void applyPowerUp(Components::Ship& ship, Components::PowerUpType type, std::uint64_t tick) const;

    GameConfig config;
};

} // namespace Systems

#endif // ASTEROIDS_COLLISION_HPP
