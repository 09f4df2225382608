#include "gf2_polynomial.hpp"

#include <stdexcept>

#include "field_errors.hpp"

namespace gf2m {

int polynomialDegree(Polynomial p) {
    if (p == 0) {
        return -1;
    }
    return 31 - __builtin_clz(p);
}

Polynomial polynomialFromCoefficients(const std::vector<int>& high_to_low) {
    if (high_to_low.empty()) {
        throw InvalidPolynomialError("Polynomial needs at least one coefficient");
    }
    if (high_to_low.size() > static_cast<std::size_t>(MAX_POLYNOMIAL_DEGREE + 1)) {
        throw InvalidPolynomialError("Polynomial degree exceeds " + std::to_string(MAX_POLYNOMIAL_DEGREE));
    }
    Polynomial p = 0;
    for (int coeff : high_to_low) {
        if (coeff != 0 && coeff != 1) {
            throw InvalidPolynomialError("Coefficient " + std::to_string(coeff) + " is not in GF(2)");
        }
        p = (p << 1) | static_cast<Polynomial>(coeff);
    }
    return p;
}

Polynomial polynomialFromExponents(const std::vector<int>& exponents) {
    Polynomial p = 0;
    for (int exp : exponents) {
        if (exp < 0 || exp > MAX_POLYNOMIAL_DEGREE) {
            throw InvalidPolynomialError("Exponent " + std::to_string(exp) + " out of range");
        }
        Polynomial term = Polynomial{1} << exp;
        if (p & term) {
            throw InvalidPolynomialError("Exponent " + std::to_string(exp) + " listed twice");
        }
        p |= term;
    }
    return p;
}

std::vector<int> polynomialCoefficients(Polynomial p) {
    int degree = polynomialDegree(p);
    if (degree < 0) {
        return {0};
    }
    std::vector<int> coeffs;
    coeffs.reserve(static_cast<std::size_t>(degree + 1));
    for (int i = degree; i >= 0; --i) {
        coeffs.push_back((p >> i) & 1U);
    }
    return coeffs;
}

std::vector<int> polynomialExponents(Polynomial p) {
    std::vector<int> exps;
    for (int i = 0; i <= MAX_POLYNOMIAL_DEGREE; ++i) {
        if ((p >> i) & 1U) {
            exps.push_back(i);
        }
    }
    return exps;
}

std::string polynomialToString(Polynomial p) {
    if (p == 0) {
        return "0";
    }
    std::string s;
    for (int i = polynomialDegree(p); i >= 0; --i) {
        if (!((p >> i) & 1U)) continue;
        if (!s.empty()) {
            s += " + ";
        }
        if (i == 0) {
            s += "1";
        } else if (i == 1) {
            s += "x";
        } else {
            s += "x^" + std::to_string(i);
        }
    }
    return s;
}

Polynomial polynomialMultiply(Polynomial a, Polynomial b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    if (polynomialDegree(a) + polynomialDegree(b) > MAX_POLYNOMIAL_DEGREE) {
        throw std::overflow_error("Product degree exceeds " + std::to_string(MAX_POLYNOMIAL_DEGREE));
    }
    Polynomial result = 0;
    while (b) {
        if (b & 1U) result ^= a;
        a <<= 1;
        b >>= 1;
    }
    return result;
}

}  // namespace gf2m
