#include "field_report.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>

#include "field_element.hpp"

namespace gf2m {

namespace {
std::string elementLabel(const FieldTable& table, int power) {
    if (power == FieldTable::ZERO_POWER) {
        return FieldElement::zero(table).toString();
    }
    return FieldElement::fromPower(table, power).toString();
}

std::string conjugateSet(const std::vector<int>& conjugates) {
    std::string s = "{";
    for (std::size_t i = 0; i < conjugates.size(); ++i) {
        if (i > 0) s += ", ";
        s += std::to_string(conjugates[i]);
    }
    return s + "}";
}

const char* layoutDescription(MinPolyLayout layout) {
    switch (layout) {
        case MinPolyLayout::EXPONENTS:
            return "exponents of nonzero terms, lowest first";
        case MinPolyLayout::COEFFICIENTS:
            return "coefficients, highest degree first";
        case MinPolyLayout::POLYNOMIAL:
            return "polynomial in x";
    }
    return "";
}

void printOperationTable(std::ostream& os, const FieldTable& table, const std::vector<std::vector<int>>& cells,
                         const char symbol) {
    const int n = table.multiplicativeOrder();
    const int width = static_cast<int>(elementLabel(table, n - 1).size()) + 2;

    os << std::setw(width) << symbol;
    for (int j = 0; j < n; ++j) {
        os << std::setw(width) << elementLabel(table, j);
    }
    os << std::endl;
    for (int i = 0; i < n; ++i) {
        os << std::setw(width) << elementLabel(table, i);
        for (int j = 0; j < n; ++j) {
            os << std::setw(width) << elementLabel(table, cells[static_cast<std::size_t>(i)][static_cast<std::size_t>(j)]);
        }
        os << std::endl;
    }
}
}

std::string formatMinimalPolynomial(Polynomial p, MinPolyLayout layout) {
    std::string s;
    switch (layout) {
        case MinPolyLayout::EXPONENTS:
            for (int exp : polynomialExponents(p)) {
                if (!s.empty()) s += ' ';
                s += std::to_string(exp);
            }
            return s;
        case MinPolyLayout::COEFFICIENTS:
            for (int coeff : polynomialCoefficients(p)) {
                s += coeff ? '1' : '0';
            }
            return s;
        case MinPolyLayout::POLYNOMIAL:
            return polynomialToString(p);
    }
    return s;
}

void printPowerTable(std::ostream& os, const FieldTable& table) {
    os << "Power/vector table (coefficient of a^" << (table.degree() - 1) << " first)" << std::endl;
    os << std::setw(10) << "Element" << std::setw(8) << "Power" << "  " << "Vector" << std::endl;
    os << std::setw(10) << "0" << std::setw(8) << "-" << "  " << table.vectorToString(0) << std::endl;
    for (int i = 0; i < table.multiplicativeOrder(); ++i) {
        os << std::setw(10) << elementLabel(table, i) << std::setw(8) << i << "  "
           << table.vectorToString(table.toVector(i)) << std::endl;
    }
}

void printMinimalPolynomialTable(std::ostream& os, const FieldTable& table, MinPolyLayout layout) {
    const auto entries = table.minimalPolynomialTable();
    std::size_t set_width = std::string("Conjugates").size();
    for (const auto& entry : entries) {
        set_width = std::max(set_width, conjugateSet(entry.conjugates).size());
    }

    os << "Minimal polynomials (" << layoutDescription(layout) << ")" << std::endl;
    os << std::setw(6) << "i" << "  " << std::left << std::setw(static_cast<int>(set_width)) << "Conjugates"
       << std::right << "  " << "Minimal polynomial" << std::endl;
    for (const auto& entry : entries) {
        os << std::setw(6) << entry.representative << "  " << std::left
           << std::setw(static_cast<int>(set_width)) << conjugateSet(entry.conjugates) << std::right << "  "
           << formatMinimalPolynomial(entry.polynomial, layout) << std::endl;
    }
}

void printAdditionTable(std::ostream& os, const FieldTable& table) {
    os << "Addition table" << std::endl;
    printOperationTable(os, table, table.additionTable(), '+');
}

void printMultiplicationTable(std::ostream& os, const FieldTable& table) {
    os << "Multiplication table" << std::endl;
    printOperationTable(os, table, table.multiplicationTable(), '*');
}

void printFieldReport(std::ostream& os, const std::string& name, const FieldTable& table,
                      const std::vector<TableKind>& tables, MinPolyLayout layout) {
    os << "\n" << std::string(60, '=') << std::endl;
    os << name << ": GF(" << table.order() << "), p(x) = " << polynomialToString(table.polynomial()) << std::endl;
    os << std::string(60, '=') << std::endl;

    for (TableKind kind : tables) {
        switch (kind) {
            case TableKind::POWER:
                printPowerTable(os, table);
                break;
            case TableKind::MINIMAL_POLYNOMIAL:
                printMinimalPolynomialTable(os, table, layout);
                break;
            case TableKind::ADDITION:
                printAdditionTable(os, table);
                break;
            case TableKind::MULTIPLICATION:
                printMultiplicationTable(os, table);
                break;
        }
        os << std::string(40, '-') << std::endl;
    }
}

}  // namespace gf2m
