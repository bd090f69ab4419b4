#include "verlet/math/vector_math.hpp"

#include <iostream>
#include <cmath>

double my_sqrt(double d) {
  if (d < 0) {
    std::cerr << "[vector_math] Warning: sqrt of negative value " << d << std::endl;
  }
  return std::sqrt(d);
}

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
	double const dx = this->x - p.x;
	double const dy = this->y - p.y;
	return my_sqrt(dx * dx + dy * dy);
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

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}

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

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
	return my_sqrt(this->x * this->x + this->y * this->y);
}

double Vector::dotProduct(const Vector& v) const {
	return this->x * v.x + this->y * v.y;
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}
