#ifndef ASTEROIDS_COMPONENTS_BASIC_HPP
#define ASTEROIDS_COMPONENTS_BASIC_HPP

#include <cstdint>
#include "asteroids/math/vector_math.hpp" // for Position, Vector

namespace Components {

    /**
     * @brief Discriminates the shared positional record.
     *
     * Every entity carries exactly one Kind; per-kind logic switches on it.
     */
    enum class EntityKind {
        Ship,
        Asteroid,
        Bullet,
        PowerUp
    };

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Kind {
        EntityKind value = EntityKind::Asteroid;

        explicit Kind(EntityKind k = EntityKind::Asteroid) : value(k) {}
    };

    // Monotonic spawn id, never reused within a session
    struct EntityId {
        std::uint64_t value = 0;

        explicit EntityId(std::uint64_t v = 0) : value(v) {}
    };

    struct Radius {
        double value = 1.0;

        explicit Radius(double v = 1.0) : value(v) {}
    };

    // Heading in radians, 0 points along +x
    struct Heading {
        double angle = 0.0;

        explicit Heading(double a = 0.0) : angle(a) {}
    };

    /**
     * @brief Marks an entity destroyed during the current tick.
     *
     * Removal happens once all systems have run.
     */
    struct Dead {};

} // namespace Components

#endif // ASTEROIDS_COMPONENTS_BASIC_HPP
