/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * This file provides the geometric primitives shared by every system:
 * - Vector class for displacements, velocities and forces
 * - Position class for point locations in world space
 * - Dot/cross products, normalisation and perpendiculars
 */

#ifndef SWARM_VECTOR_MATH_HPP
#define SWARM_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Threshold for floating point equality tests
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D point in world space
 *
 * Positions can be offset by vectors; subtracting two positions
 * yields the displacement vector between them.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /** @brief Converts Position to Vector */
    explicit operator Vector() const;

    /**
     * @brief Offsets this position by a vector
     * @param v Displacement
     * @return Displaced position
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Offsets this position by the negation of a vector
     * @param v Displacement
     * @return Displaced position
     */
    Position operator-(const Vector& v) const;

    /**
     * @brief Displacement from another position to this one
     * @param p Origin of the displacement
     * @return Vector pointing from p to this
     */
    Vector operator-(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoiding the square root */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 2D cross product with another vector
     * @param other Other vector
     * @return Cross product value (z-component)
     */
    double cross(const Vector& other) const;

    /** @brief Returns perpendicular vector (rotated 90 degrees counter-clockwise) */
    Vector perp() const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector normalises to the zero vector.
     */
    Vector normalized() const;
};

/**
 * @brief Scalar-first multiplication
 */
Vector operator*(double scalar, const Vector& v);

#endif
