/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics on a toroidal playfield
 *
 * This file provides the geometric primitives used by the game core:
 * - Vector class for velocities, directions and offsets
 * - Position class for point locations on the playfield
 * - Wraparound helpers that map positions and distances onto a torus
 */

#ifndef ASTEROIDS_VECTOR_MATH_HPP
#define ASTEROIDS_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Lengths below this are treated as zero
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Represents a 2D point on the playfield
 *
 * Screen coordinates: x grows to the right, y grows downward.
 */
class Position {
public:
    double x;
    double y;

    Position();
    Position(double x, double y);

    /** @brief Offset from the origin */
    operator Vector() const;

    /**
     * @brief Offsets this position by a vector
     * @param v Offset
     * @return New position
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Difference between two positions
     * @param b Position to subtract
     * @return Vector from b to this
     */
    Vector operator-(const Position& b) const;

    Position& operator+=(const Vector& v);

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const { return !(*this == other); }
};

/**
 * @brief Velocity, direction or offset in playfield units
 */
class Vector {
public:
    double x;
    double y;

    Vector();
    Vector(double x, double y);

    /**
     * @brief Unit vector pointing along a heading
     * @param angle Heading in radians, 0 points along +x
     */
    static Vector fromAngle(double angle);

    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;

    double length() const;

    /** @brief Squared magnitude, avoids the square root */
    double lengthSquared() const;

    /** @brief Returns normalized vector (length = 1), +x for a zero vector */
    Vector normalized() const;

    /**
     * @brief Limits the magnitude of the vector
     * @param maxLength Maximum allowed length
     * @return This vector if short enough, otherwise scaled to maxLength
     */
    Vector clampLength(double maxLength) const;

    /**
     * @brief Rotates by angle radians
     *
     * Positive angles turn clockwise on screen because y grows downward.
     */
    Vector rotateByAngle(double angle) const;

    Vector& operator+=(const Vector& v);

    bool operator==(const Vector& other) const;
    bool operator!=(const Vector& other) const { return !(*this == other); }
};

/**
 * @brief Wraps a scalar coordinate into [0, extent)
 *
 * Exact modulo, no clamping: -0.5 on an 800 wide axis becomes 799.5.
 */
double wrapCoordinate(double value, double extent);

/**
 * @brief Wraps a position into [0,width) x [0,height)
 */
Position wrapPosition(const Position& p, double width, double height);

/**
 * @brief Shortest offset from a to b across the toroidal boundary
 *
 * Each axis independently picks min(|d|, extent-|d|) with matching sign.
 */
Vector toroidalDelta(const Position& a, const Position& b, double width, double height);

/**
 * @brief Shortest distance between two points on the torus
 */
double toroidalDistance(const Position& a, const Position& b, double width, double height);

#endif // ASTEROIDS_VECTOR_MATH_HPP
