#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "field_table.hpp"
#include "gf2_polynomial.hpp"

namespace gf2m {

enum class MinPolyLayout {
    EXPONENTS,
    COEFFICIENTS,
    POLYNOMIAL
};

enum class TableKind {
    POWER,
    MINIMAL_POLYNOMIAL,
    ADDITION,
    MULTIPLICATION
};

struct FieldSpec {
    std::string name;
    int degree{};
    Polynomial polynomial{};

    FieldTable build() const { return FieldTable(degree, polynomial); }
};

struct FieldConfig {
    std::vector<FieldSpec> fields;
    MinPolyLayout layout{MinPolyLayout::EXPONENTS};
    std::vector<TableKind> tables{TableKind::POWER, TableKind::MINIMAL_POLYNOMIAL};
};

MinPolyLayout parseMinPolyLayout(const std::string& name);
bool parseTableKind(const std::string& name, TableKind& kind);

// Whole-string decimal field size, e.g. "16"; throws std::invalid_argument otherwise.
int parseFieldOrder(const std::string& text);
FieldSpec fieldSpecForOrder(int order);

FieldConfig parseFieldConfig(const nlohmann::json& data);
FieldConfig loadFieldConfig(const std::string& path);

}  // namespace gf2m
