#pragma once

#include <cstdint>
#include <string>
#include <ostream>

namespace ext2vm {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * BFieldElement - Base Field Element
 *
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * Values are kept in canonical form [0, p); every operand stack word is one
 * of these.
 */
class BFieldElement {
public:
    // The Goldilocks prime: 2^64 - 2^32 + 1
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // Constructors
    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}

    /**
     * Embed a signed integer, mapping negative values to p - |value|.
     */
    static BFieldElement from_i64(int64_t value);

    /**
     * True when value is already a canonical field element (value < p).
     */
    static constexpr bool is_canonical(uint64_t value) { return value < MODULUS; }

    // Factory methods
    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }

    // Accessors
    constexpr uint64_t value() const { return value_; }

    // Arithmetic operations
    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator/(const BFieldElement& rhs) const;
    BFieldElement operator-() const;

    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);
    BFieldElement& operator/=(const BFieldElement& rhs);

    // 2 * value, via one modular addition
    BFieldElement doubled() const { return *this + *this; }

    // Comparison
    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }

    // Field operations
    BFieldElement inverse() const;
    BFieldElement pow(uint64_t exp) const;
    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }

    // String representation
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;

    // Internal helper for modular reduction
    static uint64_t reduce(uint128_t value);
};

// Type alias for convenience
using BFE = BFieldElement;

} // namespace ext2vm
