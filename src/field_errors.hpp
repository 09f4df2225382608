#pragma once

#include <stdexcept>
#include <string>

namespace gf2m {

// Malformed degree, boundary coefficient or coefficient value.
class InvalidPolynomialError : public std::invalid_argument {
public:
    explicit InvalidPolynomialError(const std::string& what) : std::invalid_argument(what) {}
};

// Irreducible or reducible polynomial whose root does not generate all 2^m - 1 nonzero elements.
class NotPrimitiveError : public std::invalid_argument {
public:
    explicit NotPrimitiveError(const std::string& what) : std::invalid_argument(what) {}
};

class MismatchedFieldError : public std::invalid_argument {
public:
    explicit MismatchedFieldError(const std::string& what) : std::invalid_argument(what) {}
};

class OutOfRangeError : public std::out_of_range {
public:
    explicit OutOfRangeError(const std::string& what) : std::out_of_range(what) {}
};

class UnknownVectorError : public std::out_of_range {
public:
    explicit UnknownVectorError(const std::string& what) : std::out_of_range(what) {}
};

class DivideByZeroError : public std::domain_error {
public:
    explicit DivideByZeroError(const std::string& what) : std::domain_error(what) {}
};

}  // namespace gf2m
