#ifndef ASTEROIDS_COMPONENTS_GAME_HPP
#define ASTEROIDS_COMPONENTS_GAME_HPP

#include <cstdint>

namespace Components {

    enum class AsteroidTier {
        Large,
        Medium,
        Small
    };

    enum class PowerUpType {
        Ammo,
        RapidFire,
        Shield
    };

    struct Ship {
        int lives = 3;
        std::uint64_t invulnerableUntil = 0;  // Tick at which the grace window ends
        int fireCooldown = 0;                 // Ticks until the next shot is allowed
        bool thrusting = false;               // Thrust was applied on the last tick

        int ammo = 0;
        int ammoRechargeTimer = 0;
        std::uint64_t rapidFireUntil = 0;

        bool isInvulnerable(std::uint64_t tick) const { return tick < invulnerableUntil; }
        bool hasRapidFire(std::uint64_t tick) const { return tick < rapidFireUntil; }
    };

    struct Asteroid {
        AsteroidTier tier = AsteroidTier::Large;

        explicit Asteroid(AsteroidTier t = AsteroidTier::Large) : tier(t) {}
    };

    struct Bullet {
        int ttl = 0;  // Remaining ticks

        explicit Bullet(int t = 0) : ttl(t) {}
    };

    struct PowerUp {
        PowerUpType type = PowerUpType::Ammo;
        int ttl = 0;

        PowerUp(PowerUpType p = PowerUpType::Ammo, int t = 0) : type(p), ttl(t) {}
    };

    /**
     * @brief Next smaller tier.
     * @return false for Small, which has no children
     */
    inline bool smallerTier(AsteroidTier tier, AsteroidTier& out) {
        switch (tier) {
            case AsteroidTier::Large:  out = AsteroidTier::Medium; return true;
            case AsteroidTier::Medium: out = AsteroidTier::Small;  return true;
            case AsteroidTier::Small:  return false;
        }
        return false;
    }

} // namespace Components

#endif // ASTEROIDS_COMPONENTS_GAME_HPP
