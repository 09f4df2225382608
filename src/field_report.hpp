#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "field_config.hpp"
#include "field_table.hpp"
#include "gf2_polynomial.hpp"

namespace gf2m {

// EXPONENTS lists the nonzero terms from x^0 upward ("0 1 3"),
// COEFFICIENTS writes every coefficient from x^deg down to x^0 ("1011").
std::string formatMinimalPolynomial(Polynomial p, MinPolyLayout layout);

void printPowerTable(std::ostream& os, const FieldTable& table);
void printMinimalPolynomialTable(std::ostream& os, const FieldTable& table, MinPolyLayout layout);
void printAdditionTable(std::ostream& os, const FieldTable& table);
void printMultiplicationTable(std::ostream& os, const FieldTable& table);

void printFieldReport(std::ostream& os, const std::string& name, const FieldTable& table,
                      const std::vector<TableKind>& tables, MinPolyLayout layout);

}  // namespace gf2m
