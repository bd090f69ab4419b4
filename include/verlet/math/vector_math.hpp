/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics library
 *
 * This file provides the 2D primitives used by the particle solver:
 * - Vector class for displacements, implicit velocities and normals
 * - Position class for point locations in simulation space
 * - Utility functions for floating-point comparisons
 */

#ifndef VERLET_VECTOR_MATH_HPP
#define VERLET_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Utility function for safe square root computation
 *
 * @param d Input value
 * @return double Square root of input, warns if input is negative
 */
double my_sqrt(double d);

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 2D point in simulation space
 *
 * Supports translation by a Vector and differences between positions.
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

    Position operator+(const Vector& v) const;
    Vector operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    /**
     * @brief Translates this position by a displacement
     * @param v Displacement to add
     * @return Reference to this position
     */
    Position& operator+=(const Vector& v);

    /**
     * @brief Translates this position against a displacement
     * @param v Displacement to subtract
     * @return Reference to this position
     */
    Position& operator-=(const Vector& v);
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

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

#endif
