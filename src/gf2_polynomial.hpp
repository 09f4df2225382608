#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gf2m {

// Polynomial over GF(2): bit i holds the coefficient of x^i.
using Polynomial = std::uint32_t;

constexpr int MAX_POLYNOMIAL_DEGREE = 31;

int polynomialDegree(Polynomial p);

// Coefficients are given highest degree first, e.g. {1, 0, 1, 1} is x^3 + x + 1.
Polynomial polynomialFromCoefficients(const std::vector<int>& high_to_low);

// Exponents of the nonzero terms in any order, e.g. {0, 1, 3} is x^3 + x + 1.
Polynomial polynomialFromExponents(const std::vector<int>& exponents);

std::vector<int> polynomialCoefficients(Polynomial p);
std::vector<int> polynomialExponents(Polynomial p);
std::string polynomialToString(Polynomial p);

Polynomial polynomialMultiply(Polynomial a, Polynomial b);

}  // namespace gf2m
