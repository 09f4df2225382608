#include "field_element.hpp"

#include <ostream>
#include <stdexcept>

#include "field_errors.hpp"

namespace gf2m {

namespace {
void checkSameField(const FieldElement& a, const FieldElement& b, const char* op) {
    if (&a.table() != &b.table()) {
        throw MismatchedFieldError(std::string("Cannot ") + op + " elements of GF(" +
                                   std::to_string(a.table().order()) + ") and GF(" +
                                   std::to_string(b.table().order()) + ") from different tables");
    }
}

FieldElement elementAt(const FieldTable& table, int power) {
    if (power == FieldTable::ZERO_POWER) {
        return FieldElement::zero(table);
    }
    return FieldElement::fromPower(table, power);
}
}

FieldElement FieldElement::zero(const FieldTable& table) {
    return FieldElement(table, FieldTable::ZERO_POWER);
}

FieldElement FieldElement::one(const FieldTable& table) {
    return FieldElement(table, 0);
}

FieldElement FieldElement::alpha(const FieldTable& table) {
    return fromPower(table, 1);
}

FieldElement FieldElement::fromPower(const FieldTable& table, long long exponent) {
    const long long n = table.multiplicativeOrder();
    return FieldElement(table, static_cast<int>(((exponent % n) + n) % n));
}

FieldElement FieldElement::fromVector(const FieldTable& table, std::uint32_t vector) {
    return FieldElement(table, table.toPower(vector));
}

std::string FieldElement::toString() const {
    if (isZero()) {
        return "0";
    }
    if (isOne()) {
        return "1";
    }
    return "a^" + std::to_string(power_);
}

FieldElement add(const FieldElement& a, const FieldElement& b) {
    checkSameField(a, b, "add");
    return elementAt(a.table(), a.table().addPowers(a.power(), b.power()));
}

FieldElement subtract(const FieldElement& a, const FieldElement& b) {
    checkSameField(a, b, "subtract");
    return add(a, b);
}

FieldElement multiply(const FieldElement& a, const FieldElement& b) {
    checkSameField(a, b, "multiply");
    return elementAt(a.table(), a.table().multiplyPowers(a.power(), b.power()));
}

FieldElement invert(const FieldElement& a) {
    if (a.isZero()) {
        throw DivideByZeroError("Zero has no multiplicative inverse");
    }
    const int n = a.table().multiplicativeOrder();
    return FieldElement::fromPower(a.table(), (n - a.power()) % n);
}

FieldElement divide(const FieldElement& a, const FieldElement& b) {
    checkSameField(a, b, "divide");
    if (b.isZero()) {
        throw DivideByZeroError("Division by zero");
    }
    return multiply(a, invert(b));
}

FieldElement pow(const FieldElement& a, long long k) {
    if (a.isZero()) {
        if (k < 0) {
            throw DivideByZeroError("Negative power of zero");
        }
        return k == 0 ? FieldElement::one(a.table()) : a;
    }
    const long long n = a.table().multiplicativeOrder();
    return FieldElement::fromPower(a.table(), a.power() * (k % n));
}

std::vector<int> conjugates(const FieldElement& a) {
    return a.table().conjugacyClass(a.power());
}

Polynomial minimalPolynomial(const FieldElement& a) {
    const FieldTable& table = a.table();

    // Product of (x - c) over the conjugates, lowest degree first.
    std::vector<FieldElement> poly{FieldElement::one(table)};
    for (int c : conjugates(a)) {
        FieldElement root = elementAt(table, c);
        std::vector<FieldElement> next(poly.size() + 1, FieldElement::zero(table));
        for (std::size_t i = 0; i < poly.size(); ++i) {
            next[i] = next[i] + poly[i] * root;
            next[i + 1] = next[i + 1] + poly[i];
        }
        poly.swap(next);
    }

    Polynomial binary = 0;
    for (std::size_t i = 0; i < poly.size(); ++i) {
        if (poly[i].isOne()) {
            binary |= Polynomial{1} << i;
        } else if (!poly[i].isZero()) {
            throw std::runtime_error("Minimal polynomial of " + a.toString() + " has non-binary coefficient " +
                                     poly[i].toString());
        }
    }
    return binary;
}

std::vector<int> minimalPolynomialExponents(const FieldElement& a) {
    return polynomialExponents(minimalPolynomial(a));
}

FieldElement evaluate(Polynomial p, const FieldElement& x) {
    const FieldTable& table = x.table();
    FieldElement result = FieldElement::zero(table);
    for (int i = polynomialDegree(p); i >= 0; --i) {
        result = result * x;
        if ((p >> i) & 1U) {
            result = result + FieldElement::one(table);
        }
    }
    return result;
}

bool operator==(const FieldElement& a, const FieldElement& b) {
    checkSameField(a, b, "compare");
    return a.power() == b.power();
}

bool operator!=(const FieldElement& a, const FieldElement& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const FieldElement& a) {
    return os << a.toString() << " GF(" << a.table().order() << ")";
}

}  // namespace gf2m
