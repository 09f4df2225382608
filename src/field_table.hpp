#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "gf2_polynomial.hpp"

namespace gf2m {

// Power/vector correspondence for GF(2^m) built from a primitive polynomial.
//
// Vectors are bitmasks over the polynomial basis: bit i holds the coefficient
// of alpha^i, so alpha^0 = 0b0...01. Powers run over 0 .. 2^m - 2; the zero
// element has power ZERO_POWER and vector 0. The table never changes after
// construction.
class FieldTable {
public:
    static constexpr int ZERO_POWER = -1;
    static constexpr int MAX_DEGREE = 16;

    struct MinimalPolynomialEntry {
        int representative{};
        std::vector<int> conjugates;
        Polynomial polynomial{};
    };

    // Throws InvalidPolynomialError if m is outside 1..MAX_DEGREE, the
    // polynomial's degree is not m or its constant term is 0. Throws
    // NotPrimitiveError if alpha's powers cycle before reaching 2^m - 1.
    FieldTable(int m, Polynomial polynomial);

    static FieldTable fromCoefficients(const std::vector<int>& high_to_low);
    static FieldTable fromExponents(const std::vector<int>& exponents);
    static FieldTable forOrder(int order);

    // Lin & Costello, Table 2.7.
    static Polynomial defaultPolynomial(int m);
    static int degreeForOrder(int order);

    int degree() const { return m_; }
    int order() const { return 1 << m_; }
    int multiplicativeOrder() const { return n_; }
    Polynomial polynomial() const { return polynomial_; }

    std::uint32_t toVector(int power) const;
    int toPower(std::uint32_t vector) const;
    std::string vectorToString(std::uint32_t vector) const;

    int addPowers(int a, int b) const;
    int multiplyPowers(int a, int b) const;

    std::vector<int> conjugacyClass(int power) const;
    std::vector<MinimalPolynomialEntry> minimalPolynomialTable() const;

    // Rows and columns are indexed by power 0 .. 2^m - 2.
    std::vector<std::vector<int>> additionTable() const;
    std::vector<std::vector<int>> multiplicationTable() const;

private:
    int m_;
    int n_;
    Polynomial polynomial_;
    std::vector<std::uint32_t> alpha_to_;
    std::vector<int> index_of_;

    void buildField();
    void checkPower(int power) const;
    std::uint32_t vectorMultiply(std::uint32_t a, std::uint32_t b) const;
    Polynomial minimalPolynomialFromClass(const std::vector<int>& cls) const;
};

}  // namespace gf2m
