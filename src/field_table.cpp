#include "field_table.hpp"

#include <array>
#include <stdexcept>
#include <utility>

#include "field_errors.hpp"

namespace gf2m {

namespace {
constexpr std::array<Polynomial, FieldTable::MAX_DEGREE + 1> DEFAULT_POLYNOMIALS{{
    0x0,      // unused
    0x3,      // x + 1
    0x7,      // x^2 + x + 1
    0xB,      // x^3 + x + 1
    0x13,     // x^4 + x + 1
    0x25,     // x^5 + x^2 + 1
    0x43,     // x^6 + x + 1
    0x89,     // x^7 + x^3 + 1
    0x11D,    // x^8 + x^4 + x^3 + x^2 + 1
    0x211,    // x^9 + x^4 + 1
    0x409,    // x^10 + x^3 + 1
    0x805,    // x^11 + x^2 + 1
    0x1053,   // x^12 + x^6 + x^4 + x + 1
    0x201B,   // x^13 + x^4 + x^3 + x + 1
    0x4443,   // x^14 + x^10 + x^6 + x + 1
    0x8003,   // x^15 + x + 1
    0x1100B   // x^16 + x^12 + x^3 + x + 1
}};
}

FieldTable::FieldTable(int m, Polynomial polynomial) : m_(m), n_(0), polynomial_(polynomial) {
    if (m < 1 || m > MAX_DEGREE) {
        throw InvalidPolynomialError("Extension degree must be between 1 and " + std::to_string(MAX_DEGREE) +
                                     ", got " + std::to_string(m));
    }
    if (polynomialDegree(polynomial) != m) {
        throw InvalidPolynomialError("Polynomial " + polynomialToString(polynomial) + " does not have degree " +
                                     std::to_string(m));
    }
    if (!(polynomial & 1U)) {
        throw InvalidPolynomialError("Polynomial " + polynomialToString(polynomial) + " has no constant term");
    }
    n_ = (1 << m) - 1;
    buildField();
}

FieldTable FieldTable::fromCoefficients(const std::vector<int>& high_to_low) {
    return FieldTable(static_cast<int>(high_to_low.size()) - 1, polynomialFromCoefficients(high_to_low));
}

FieldTable FieldTable::fromExponents(const std::vector<int>& exponents) {
    Polynomial p = polynomialFromExponents(exponents);
    return FieldTable(polynomialDegree(p), p);
}

FieldTable FieldTable::forOrder(int order) {
    int m = degreeForOrder(order);
    return FieldTable(m, defaultPolynomial(m));
}

int FieldTable::degreeForOrder(int order) {
    for (int m = 1; m <= MAX_DEGREE; ++m) {
        if ((1 << m) == order) {
            return m;
        }
    }
    throw InvalidPolynomialError("No default primitive polynomial for field order " + std::to_string(order));
}

Polynomial FieldTable::defaultPolynomial(int m) {
    if (m < 1 || m > MAX_DEGREE) {
        throw InvalidPolynomialError("No default primitive polynomial for degree " + std::to_string(m));
    }
    return DEFAULT_POLYNOMIALS[static_cast<std::size_t>(m)];
}

void FieldTable::buildField() {
    const std::uint32_t top = std::uint32_t{1} << m_;
    alpha_to_.assign(static_cast<std::size_t>(n_), 0);
    index_of_.assign(static_cast<std::size_t>(top), ZERO_POWER);

    std::uint32_t current = 1;
    for (int i = 0; i < n_; ++i) {
        if (index_of_[current] != ZERO_POWER) {
            throw NotPrimitiveError("Polynomial " + polynomialToString(polynomial_) + " is not primitive: alpha^" +
                                    std::to_string(i) + " = alpha^" + std::to_string(index_of_[current]));
        }
        alpha_to_[static_cast<std::size_t>(i)] = current;
        index_of_[current] = i;

        current <<= 1;
        if (current & top) {
            current ^= polynomial_;
        }
    }
}

void FieldTable::checkPower(int power) const {
    if (power < 0 || power >= n_) {
        throw OutOfRangeError("Power " + std::to_string(power) + " outside 0.." + std::to_string(n_ - 1));
    }
}

std::uint32_t FieldTable::toVector(int power) const {
    if (power == ZERO_POWER) {
        return 0;
    }
    checkPower(power);
    return alpha_to_[static_cast<std::size_t>(power)];
}

int FieldTable::toPower(std::uint32_t vector) const {
    if (vector == 0) {
        return ZERO_POWER;
    }
    if (vector >= index_of_.size() || index_of_[vector] == ZERO_POWER) {
        throw UnknownVectorError("Vector " + std::to_string(vector) + " is not an element of GF(" +
                                 std::to_string(order()) + ")");
    }
    return index_of_[vector];
}

std::string FieldTable::vectorToString(std::uint32_t vector) const {
    std::string s;
    for (int i = m_ - 1; i >= 0; --i) s += ((vector >> i) & 1U) ? '1' : '0';
    return s;
}

int FieldTable::addPowers(int a, int b) const {
    return toPower(toVector(a) ^ toVector(b));
}

int FieldTable::multiplyPowers(int a, int b) const {
    if (a == ZERO_POWER || b == ZERO_POWER) {
        return ZERO_POWER;
    }
    checkPower(a);
    checkPower(b);
    return (a + b) % n_;
}

std::uint32_t FieldTable::vectorMultiply(std::uint32_t a, std::uint32_t b) const {
    if (a == 0 || b == 0) {
        return 0;
    }
    return alpha_to_[static_cast<std::size_t>((toPower(a) + toPower(b)) % n_)];
}

std::vector<int> FieldTable::conjugacyClass(int power) const {
    if (power == ZERO_POWER) {
        return {ZERO_POWER};
    }
    checkPower(power);
    std::vector<int> cls;
    int current = power;
    do {
        cls.push_back(current);
        current = (current * 2) % n_;
    } while (current != power);
    return cls;
}

Polynomial FieldTable::minimalPolynomialFromClass(const std::vector<int>& cls) const {
    // Coefficients in vector form, lowest degree first.
    std::vector<std::uint32_t> poly = {1};
    for (int exp : cls) {
        std::vector<std::uint32_t> next(poly.size() + 1, 0);
        std::uint32_t root = toVector(exp);
        for (std::size_t i = 0; i < poly.size(); ++i) {
            next[i] ^= vectorMultiply(poly[i], root);
            next[i + 1] ^= poly[i];
        }
        poly.swap(next);
    }

    Polynomial binary = 0;
    for (std::size_t i = 0; i < poly.size(); ++i) {
        if (poly[i] > 1) {
            throw std::runtime_error("Minimal polynomial has non-binary coefficient");
        }
        binary |= poly[i] << i;
    }
    return binary;
}

std::vector<FieldTable::MinimalPolynomialEntry> FieldTable::minimalPolynomialTable() const {
    std::vector<MinimalPolynomialEntry> entries;
    std::vector<bool> visited(static_cast<std::size_t>(n_), false);
    for (int i = 0; i < n_; ++i) {
        if (visited[static_cast<std::size_t>(i)]) {
            continue;
        }
        MinimalPolynomialEntry entry;
        entry.representative = i;
        entry.conjugates = conjugacyClass(i);
        for (int c : entry.conjugates) {
            visited[static_cast<std::size_t>(c)] = true;
        }
        entry.polynomial = minimalPolynomialFromClass(entry.conjugates);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<std::vector<int>> FieldTable::additionTable() const {
    std::vector<std::vector<int>> sums(static_cast<std::size_t>(n_), std::vector<int>(static_cast<std::size_t>(n_)));
    for (int i = 0; i < n_; ++i) {
        for (int j = 0; j < n_; ++j) {
            sums[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)] = addPowers(i, j);
        }
    }
    return sums;
}

std::vector<std::vector<int>> FieldTable::multiplicationTable() const {
    std::vector<std::vector<int>> products(static_cast<std::size_t>(n_),
                                           std::vector<int>(static_cast<std::size_t>(n_)));
    for (int i = 0; i < n_; ++i) {
        for (int j = 0; j < n_; ++j) {
            products[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)] = multiplyPowers(i, j);
        }
    }
    return products;
}

}  // namespace gf2m
