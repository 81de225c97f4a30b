/**
 * @file wave.hpp
 * @brief System that starts a new wave once the asteroid field is cleared
 */

#ifndef ASTEROIDS_WAVE_HPP
#define ASTEROIDS_WAVE_HPP

#include <entt/entt.hpp>
#include "asteroids/math/vector_math.hpp"
#include "asteroids/systems/i_system.hpp"

namespace Systems {

/**
 * @class WaveSystem
 * @brief Spawns initialCount + wave Large asteroids whenever none are left
 *
 * Asteroids appear in a band along the screen edges, one large radius wide,
 * with a random direction and a speed in [minSpeed, maxSpeed]. Candidates
 * within safeSpawnRadius of the ship spawn point (screen centre) or of the
 * current ship position are rejected and redrawn.
 */
class WaveSystem : public ISystem {
public:
    WaveSystem() = default;
    ~WaveSystem() override = default;

    void update(entt::registry& registry, TickContext& ctx) override;
    void setGameConfig(const GameConfig& config) override;

    /**
     * @brief Advances the wave counter and spawns its asteroids
     *
     * Also used by the session to populate wave 1.
     *
     * @return Number of asteroids spawned
     */
    int startNextWave(entt::registry& registry, std::mt19937& rng) const;

private:
    Position pickSpawnPosition(const Position& shipPosition, std::mt19937& rng) const;

    GameConfig config;
};

} // namespace Systems

#endif // ASTEROIDS_WAVE_HPP
