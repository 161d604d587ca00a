#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <string>

namespace ext2vm {

/**
 * Ext2Element - Quadratic Extension Element
 *
 * Element of the degree-2 extension of the Goldilocks field, represented as
 * c0 + c1*z where z^2 = NON_RESIDUE = -2.
 *
 * On the operand stack an element occupies two consecutive words with c1
 * nearer the top, i.e. reading top to bottom: [c1, c0].
 *
 * Note: -2 is a square modulo the Goldilocks prime, so the quotient ring is
 * not a field. Addition and multiplication are unaffected; inverse() throws
 * for elements of zero norm.
 */
class Ext2Element {
public:
    static constexpr size_t EXTENSION_DEGREE = 2;

    // z^2 = -2
    static constexpr uint64_t NON_RESIDUE_VALUE = BFieldElement::MODULUS - 2;

    // Constructors
    constexpr Ext2Element() : coeffs_{BFieldElement::zero(), BFieldElement::zero()} {}

    constexpr Ext2Element(BFieldElement c0, BFieldElement c1) : coeffs_{c0, c1} {}

    // Construct from a base field element (embed as (base, 0))
    constexpr explicit Ext2Element(BFieldElement base) : coeffs_{base, BFieldElement::zero()} {}

    /**
     * Build from the two stack words, given top first.
     */
    static constexpr Ext2Element from_stack(BFieldElement top, BFieldElement below) {
        return Ext2Element(below, top);
    }

    // Factory methods
    static constexpr Ext2Element zero() { return Ext2Element(); }

    static constexpr Ext2Element one() {
        return Ext2Element(BFieldElement::one(), BFieldElement::zero());
    }

    static constexpr BFieldElement non_residue() { return BFieldElement(NON_RESIDUE_VALUE); }

    // Accessors
    constexpr const std::array<BFieldElement, 2>& coefficients() const { return coeffs_; }
    constexpr BFieldElement coeff(size_t i) const { return coeffs_[i]; }

    /**
     * Stack encoding, top first: [c1, c0].
     */
    std::array<BFieldElement, 2> to_stack() const { return {coeffs_[1], coeffs_[0]}; }

    // Arithmetic operations
    Ext2Element operator+(const Ext2Element& rhs) const;
    Ext2Element operator-(const Ext2Element& rhs) const;
    Ext2Element operator*(const Ext2Element& rhs) const;
    Ext2Element operator/(const Ext2Element& rhs) const;
    Ext2Element operator-() const;

    Ext2Element& operator+=(const Ext2Element& rhs);
    Ext2Element& operator-=(const Ext2Element& rhs);
    Ext2Element& operator*=(const Ext2Element& rhs);

    // Mixed arithmetic with BFieldElement
    Ext2Element operator*(const BFieldElement& rhs) const;

    // Comparison
    bool operator==(const Ext2Element& rhs) const;
    bool operator!=(const Ext2Element& rhs) const;

    // c0 - c1*z
    Ext2Element conjugate() const;

    // c0^2 - NON_RESIDUE * c1^2 = c0^2 + 2*c1^2
    BFieldElement norm() const;

    Ext2Element inverse() const;
    Ext2Element pow(uint64_t exp) const;
    bool is_zero() const;
    bool is_one() const;

    // String representation
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const Ext2Element& elem);
    friend Ext2Element operator*(const BFieldElement& lhs, const Ext2Element& rhs);

private:
    std::array<BFieldElement, 2> coeffs_;
};

// Type alias for convenience
using E2 = Ext2Element;

} // namespace ext2vm
