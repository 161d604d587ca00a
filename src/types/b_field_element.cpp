#include "types/b_field_element.hpp"
#include <stdexcept>

namespace ext2vm {

uint64_t BFieldElement::reduce(uint128_t value) {
    return static_cast<uint64_t>(value % MODULUS);
}

BFieldElement BFieldElement::from_i64(int64_t value) {
    if (value >= 0) {
        return BFieldElement(static_cast<uint64_t>(value));
    }
    // |value| computed in unsigned arithmetic so INT64_MIN is representable
    uint64_t magnitude = 0 - static_cast<uint64_t>(value);
    return -BFieldElement(magnitude);
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Operands are < p, so one conditional subtraction restores canonical form.
    // A carry out of 64 bits means the true sum is >= 2^64 > p.
    uint64_t sum = value_ + rhs.value_;
    const bool carry = sum < value_;
    if (carry || sum >= MODULUS) {
        sum -= MODULUS;
    }
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    if (value_ < rhs.value_) {
        diff += MODULUS;
    }
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    const uint128_t wide = static_cast<uint128_t>(value_) * rhs.value_;
    return BFieldElement(reduce(wide));
}

BFieldElement BFieldElement::operator-() const {
    return is_zero() ? *this : BFieldElement(MODULUS - value_);
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    return *this = *this + rhs;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    return *this = *this - rhs;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    return *this = *this * rhs;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    return *this = *this / rhs;
}

// Square-and-multiply, least significant bit first
BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement acc = one();
    for (BFieldElement square = *this; exp != 0; exp >>= 1, square *= square) {
        if (exp & 1) {
            acc *= square;
        }
    }
    return acc;
}

BFieldElement BFieldElement::inverse() const {
    if (is_zero()) {
        throw std::domain_error("Cannot invert zero");
    }
    // x^(p-2) = x^-1 for x != 0
    return pow(MODULUS - 2);
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace ext2vm
