#include "field_config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "field_errors.hpp"

namespace gf2m {

namespace {
FieldSpec parseFieldEntry(const nlohmann::json& entry, std::size_t index) {
    if (!entry.is_object()) {
        throw std::runtime_error("Field entry " + std::to_string(index) + " is not an object");
    }
    int given = static_cast<int>(entry.contains("polynomial")) + static_cast<int>(entry.contains("order")) +
                static_cast<int>(entry.contains("exponents"));
    if (given != 1) {
        throw std::runtime_error("Field entry " + std::to_string(index) +
                                 " needs exactly one of \"polynomial\", \"order\" or \"exponents\"");
    }
    for (const auto& item : entry.items()) {
        const std::string& key = item.key();
        if (key != "name" && key != "polynomial" && key != "order" && key != "exponents") {
            std::cerr << "Warning: ignoring unknown key '" << key << "' in field entry " << index << std::endl;
        }
    }

    FieldSpec spec;
    if (entry.contains("order")) {
        spec = fieldSpecForOrder(entry.at("order").get<int>());
    } else if (entry.contains("polynomial")) {
        auto coeffs = entry.at("polynomial").get<std::vector<int>>();
        spec.degree = static_cast<int>(coeffs.size()) - 1;
        spec.polynomial = polynomialFromCoefficients(coeffs);
    } else {
        spec.polynomial = polynomialFromExponents(entry.at("exponents").get<std::vector<int>>());
        spec.degree = polynomialDegree(spec.polynomial);
    }
    if (entry.contains("name")) {
        spec.name = entry.at("name").get<std::string>();
    } else if (spec.name.empty()) {
        spec.name = "GF(2^" + std::to_string(spec.degree) + ")";
    }
    return spec;
}
}

MinPolyLayout parseMinPolyLayout(const std::string& name) {
    if (name == "exponents") return MinPolyLayout::EXPONENTS;
    if (name == "coefficients") return MinPolyLayout::COEFFICIENTS;
    if (name == "polynomial") return MinPolyLayout::POLYNOMIAL;
    throw std::invalid_argument("Unknown minimal polynomial layout: " + name);
}

bool parseTableKind(const std::string& name, TableKind& kind) {
    if (name == "power") {
        kind = TableKind::POWER;
    } else if (name == "minpoly") {
        kind = TableKind::MINIMAL_POLYNOMIAL;
    } else if (name == "add") {
        kind = TableKind::ADDITION;
    } else if (name == "mul") {
        kind = TableKind::MULTIPLICATION;
    } else {
        return false;
    }
    return true;
}

int parseFieldOrder(const std::string& text) {
    std::size_t used = 0;
    int order = 0;
    try {
        order = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Field order is not an integer: '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("Field order is not an integer: '" + text + "'");
    }
    return order;
}

FieldSpec fieldSpecForOrder(int order) {
    int m = FieldTable::degreeForOrder(order);
    return {"GF(" + std::to_string(order) + ")", m, FieldTable::defaultPolynomial(m)};
}

FieldConfig parseFieldConfig(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::runtime_error("Field config must be a JSON object");
    }
    for (const auto& item : data.items()) {
        const std::string& key = item.key();
        if (key != "fields" && key != "minpoly_layout" && key != "tables") {
            std::cerr << "Warning: ignoring unknown key '" << key << "' in field config" << std::endl;
        }
    }

    FieldConfig config;
    if (data.contains("minpoly_layout")) {
        config.layout = parseMinPolyLayout(data.at("minpoly_layout").get<std::string>());
    }
    if (data.contains("tables")) {
        config.tables.clear();
        for (const auto& item : data.at("tables")) {
            auto name = item.get<std::string>();
            TableKind kind;
            if (parseTableKind(name, kind)) {
                config.tables.push_back(kind);
            } else {
                std::cerr << "Warning: skipping unknown table '" << name << "'" << std::endl;
            }
        }
    }
    const auto& fields = data.at("fields");
    for (std::size_t i = 0; i < fields.size(); ++i) {
        config.fields.push_back(parseFieldEntry(fields.at(i), i));
    }
    return config;
}

FieldConfig loadFieldConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Unable to open field config: " + path);
    }
    nlohmann::json data;
    try {
        file >> data;
        return parseFieldConfig(data);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse field config '" + path + "': " + e.what());
    }
}

}  // namespace gf2m
