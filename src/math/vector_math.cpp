#include "asteroids/math/vector_math.hpp"

#include <cmath>

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

bool Position::operator==(const Position& other) const {
  return this->x == other.x && this->y == other.y;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::fromAngle(double angle) {
  return {std::cos(angle), std::sin(angle)};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
}

Vector Vector::clampLength(double maxLength) const {
  double const len = this->length();
  if (len > maxLength && len > EPSILON) {
    return *this * (maxLength / len);
  }
  return *this;
}

Vector Vector::rotateByAngle(double angle) const {
  double const c = std::cos(angle);
  double const s = std::sin(angle);
  return {this->x*c - this->y*s, this->x*s + this->y*c};
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

bool Vector::operator==(const Vector& other) const {
  return this->x == other.x && this->y == other.y;
}

// Toroidal helpers

double wrapCoordinate(double value, double extent) {
  double wrapped = std::fmod(value, extent);
  if (wrapped < 0.0) {
    wrapped += extent;
  }
  // -1e-17 + 800 rounds to 800, which is outside the half-open range
  if (wrapped >= extent) {
    wrapped = 0.0;
  }
  return wrapped;
}

Position wrapPosition(const Position& p, double width, double height) {
  return {wrapCoordinate(p.x, width), wrapCoordinate(p.y, height)};
}

static double shortestAxisDelta(double from, double to, double extent) {
  double d = std::fmod(to - from, extent);
  if (d > extent * 0.5) {
    d -= extent;
  } else if (d < -extent * 0.5) {
    d += extent;
  }
  return d;
}

Vector toroidalDelta(const Position& a, const Position& b, double width, double height) {
  return {shortestAxisDelta(a.x, b.x, width), shortestAxisDelta(a.y, b.y, height)};
}

double toroidalDistance(const Position& a, const Position& b, double width, double height) {
  return toroidalDelta(a, b, width, height).length();
}
