#include "types/ext2_element.hpp"
#include <sstream>
#include <stdexcept>

namespace ext2vm {

Ext2Element Ext2Element::operator+(const Ext2Element& rhs) const {
    return Ext2Element(coeffs_[0] + rhs.coeffs_[0], coeffs_[1] + rhs.coeffs_[1]);
}

Ext2Element Ext2Element::operator-(const Ext2Element& rhs) const {
    return Ext2Element(coeffs_[0] - rhs.coeffs_[0], coeffs_[1] - rhs.coeffs_[1]);
}

Ext2Element Ext2Element::operator*(const Ext2Element& rhs) const {
    // (a0 + a1*z) * (b0 + b1*z) with z^2 = -2, three base multiplications:
    //   t0 = a0*b0, t1 = a1*b1, t2 = (a0 + a1)*(b0 + b1)
    //   c0 = t0 - 2*t1
    //   c1 = t2 - t0 - t1
    const auto& a = coeffs_;
    const auto& b = rhs.coeffs_;

    BFieldElement t0 = a[0] * b[0];
    BFieldElement t1 = a[1] * b[1];
    BFieldElement t2 = (a[0] + a[1]) * (b[0] + b[1]);

    return Ext2Element(t0 - t1.doubled(), t2 - t0 - t1);
}

Ext2Element Ext2Element::operator-() const {
    return Ext2Element(-coeffs_[0], -coeffs_[1]);
}

Ext2Element& Ext2Element::operator+=(const Ext2Element& rhs) {
    *this = *this + rhs;
    return *this;
}

Ext2Element& Ext2Element::operator-=(const Ext2Element& rhs) {
    *this = *this - rhs;
    return *this;
}

Ext2Element& Ext2Element::operator*=(const Ext2Element& rhs) {
    *this = *this * rhs;
    return *this;
}

Ext2Element Ext2Element::operator*(const BFieldElement& rhs) const {
    return Ext2Element(coeffs_[0] * rhs, coeffs_[1] * rhs);
}

bool Ext2Element::operator==(const Ext2Element& rhs) const {
    return coeffs_[0] == rhs.coeffs_[0] && coeffs_[1] == rhs.coeffs_[1];
}

bool Ext2Element::operator!=(const Ext2Element& rhs) const {
    return !(*this == rhs);
}

bool Ext2Element::is_zero() const {
    return coeffs_[0].is_zero() && coeffs_[1].is_zero();
}

bool Ext2Element::is_one() const {
    return coeffs_[0].is_one() && coeffs_[1].is_zero();
}

Ext2Element Ext2Element::conjugate() const {
    return Ext2Element(coeffs_[0], -coeffs_[1]);
}

BFieldElement Ext2Element::norm() const {
    const BFieldElement& c0 = coeffs_[0];
    const BFieldElement& c1 = coeffs_[1];
    return c0 * c0 + (c1 * c1).doubled();
}

Ext2Element Ext2Element::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }

    // x * conj(x) = norm(x), so x^-1 = conj(x) / norm(x)
    BFieldElement n = norm();
    if (n.is_zero()) {
        throw std::domain_error("Cannot invert zero divisor " + to_string());
    }
    return conjugate() * n.inverse();
}

Ext2Element Ext2Element::operator/(const Ext2Element& rhs) const {
    return *this * rhs.inverse();
}

Ext2Element Ext2Element::pow(uint64_t exp) const {
    Ext2Element result = Ext2Element::one();
    Ext2Element base = *this;

    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }

    return result;
}

std::string Ext2Element::to_string() const {
    std::ostringstream oss;
    oss << "(" << coeffs_[0].value() << ", " << coeffs_[1].value() << ")";
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Ext2Element& elem) {
    return os << elem.to_string();
}

Ext2Element operator*(const BFieldElement& lhs, const Ext2Element& rhs) {
    return rhs * lhs;
}

} // namespace ext2vm
