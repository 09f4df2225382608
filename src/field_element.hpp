#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "field_table.hpp"
#include "gf2_polynomial.hpp"

namespace gf2m {

// One element of GF(2^m), held in power form. The element refers to its
// FieldTable without owning it, so the table must outlive every element
// built from it. Arithmetic never modifies an operand; operands from
// different tables raise MismatchedFieldError.
class FieldElement {
public:
    static FieldElement zero(const FieldTable& table);
    static FieldElement one(const FieldTable& table);
    static FieldElement alpha(const FieldTable& table);

    // Any integer exponent, reduced modulo 2^m - 1.
    static FieldElement fromPower(const FieldTable& table, long long exponent);
    static FieldElement fromVector(const FieldTable& table, std::uint32_t vector);

    const FieldTable& table() const { return *table_; }
    int power() const { return power_; }
    std::uint32_t vector() const { return table_->toVector(power_); }
    bool isZero() const { return power_ == FieldTable::ZERO_POWER; }
    bool isOne() const { return power_ == 0; }

    // "0", "1" or "a^i".
    std::string toString() const;

private:
    FieldElement(const FieldTable& table, int power) : table_(&table), power_(power) {}

    const FieldTable* table_;
    int power_;
};

FieldElement add(const FieldElement& a, const FieldElement& b);
FieldElement subtract(const FieldElement& a, const FieldElement& b);
FieldElement multiply(const FieldElement& a, const FieldElement& b);
FieldElement divide(const FieldElement& a, const FieldElement& b);
FieldElement invert(const FieldElement& a);
FieldElement pow(const FieldElement& a, long long k);

std::vector<int> conjugates(const FieldElement& a);
Polynomial minimalPolynomial(const FieldElement& a);

// Positions of the nonzero coefficients, as listed in Lin & Costello Appendix B.
std::vector<int> minimalPolynomialExponents(const FieldElement& a);

FieldElement evaluate(Polynomial p, const FieldElement& x);

bool operator==(const FieldElement& a, const FieldElement& b);
bool operator!=(const FieldElement& a, const FieldElement& b);

inline FieldElement operator+(const FieldElement& a, const FieldElement& b) { return add(a, b); }
inline FieldElement operator-(const FieldElement& a, const FieldElement& b) { return subtract(a, b); }
inline FieldElement operator*(const FieldElement& a, const FieldElement& b) { return multiply(a, b); }
inline FieldElement operator/(const FieldElement& a, const FieldElement& b) { return divide(a, b); }

// Prints the element followed by its field, e.g. "a^3 GF(16)".
std::ostream& operator<<(std::ostream& os, const FieldElement& a);

}  // namespace gf2m
