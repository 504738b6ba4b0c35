#include "swarm/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return Vector(this->x, this->y);
}

Position Position::operator+(const Vector& v) const {
  return Position(this->x + v.x, this->y + v.y);
}

Position Position::operator-(const Vector& v) const {
  return Position(this->x - v.x, this->y - v.y);
}

Vector Position::operator-(const Position& p) const {
  return Vector(this->x - p.x, this->y - p.y);
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

Vector Vector::operator-() const {
  return Vector(-this->x, -this->y);
}

Vector Vector::operator+(const Vector& b) const {
  return Vector(this->x + b.x, this->y + b.y);
}

Vector Vector::operator-(const Vector& b) const {
  return Vector(this->x - b.x, this->y - b.y);
}

Vector Vector::operator*(const double scalar) const {
  return Vector(this->x * scalar, this->y * scalar);
}

Vector Vector::operator/(const double scalar) const {
  return Vector(this->x / scalar, this->y / scalar);
}

Vector& Vector::operator+=(const Vector& b) {
  this->x += b.x;
  this->y += b.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& b) {
  this->x -= b.x;
  this->y -= b.y;
  return *this;
}

Vector& Vector::operator*=(const double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  return *this;
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y;
}

bool Vector::operator!=(const Vector& v) const {
  return !(*this == v);
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

double Vector::cross(const Vector& other) const {
  return this->x * other.y - this->y * other.x;
}

Vector Vector::perp() const {
  return Vector(-this->y, this->x);
}

Vector Vector::normalized() const {
  double const len = length();
  if (len < EPSILON) {
    return Vector(0.0, 0.0);
  }
  return Vector(this->x / len, this->y / len);
}

Vector operator*(const double scalar, const Vector& v) {
  return v * scalar;
}
