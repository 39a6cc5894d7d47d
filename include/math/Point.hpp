// math/Point.hpp
#ifndef MATH_POINT_HPP
#define MATH_POINT_HPP

#include <ostream>
#include <string>
#include <variant>
#include <gmpxx.h>

namespace math {

/// Affine point (x, y) of the plane, or the point at infinity.
/// Carries no curve and no arithmetic; see CurveGroup.
class Point {
public:
    struct Infinity {};
    struct Affine {
        mpz_class x;
        mpz_class y;
    };

    Point(const mpz_class& x, const mpz_class& y);
    static Point infinity();

    bool isInfinity() const { return std::holds_alternative<Infinity>(value_); }
    const mpz_class& x() const;
    const mpz_class& y() const;

    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    std::string toString() const;

private:
    Point() : value_(Infinity{}) {}

    std::variant<Infinity, Affine> value_;
};

std::ostream& operator<<(std::ostream& os, const Point& p);

} // namespace math

#endif // MATH_POINT_HPP
