#include "math/Point.hpp"
#include <sstream>
#include <stdexcept>

namespace math {

Point::Point(const mpz_class& x, const mpz_class& y)
  : value_(Affine{x, y})
{}

Point Point::infinity() {
    return Point();
}

const mpz_class& Point::x() const {
    if (auto a = std::get_if<Affine>(&value_)) return a->x;
    throw std::logic_error("Point::x() on the point at infinity");
}

const mpz_class& Point::y() const {
    if (auto a = std::get_if<Affine>(&value_)) return a->y;
    throw std::logic_error("Point::y() on the point at infinity");
}

bool Point::operator==(const Point& other) const {
    const Affine* a = std::get_if<Affine>(&value_);
    const Affine* b = std::get_if<Affine>(&other.value_);
    if (!a || !b) return !a && !b;
    return a->x == b->x && a->y == b->y;
}

std::string Point::toString() const {
    if (isInfinity()) return "O";
    std::ostringstream oss;
    oss << "(x,y) = (" << x().get_str() << ", " << y().get_str() << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Point& p) {
    return os << p.toString();
}

} // namespace math
