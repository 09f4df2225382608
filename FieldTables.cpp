#include <iostream>
#include <string>
#include <vector>

#include "src/field_config.hpp"
#include "src/field_report.hpp"
#include "src/field_table.hpp"

namespace {
void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config <path>] [--order <q>] [--layout exponents|coefficients|polynomial]"
                 " [--table power|minpoly|add|mul]..."
              << std::endl;
}
}

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        int order = 16;
        std::string layout_name;
        std::vector<gf2m::TableKind> tables;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--order" && i + 1 < argc) {
                order = gf2m::parseFieldOrder(argv[++i]);
            } else if (arg == "--layout" && i + 1 < argc) {
                layout_name = argv[++i];
            } else if (arg == "--table" && i + 1 < argc) {
                std::string name = argv[++i];
                gf2m::TableKind kind;
                if (gf2m::parseTableKind(name, kind)) {
                    tables.push_back(kind);
                } else {
                    std::cerr << "Warning: skipping unknown table '" << name << "'" << std::endl;
                }
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: unrecognised argument '" << arg << "'" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        gf2m::FieldConfig config;
        if (!config_path.empty()) {
            config = gf2m::loadFieldConfig(config_path);
        } else {
            config.fields.push_back(gf2m::fieldSpecForOrder(order));
        }
        if (!layout_name.empty()) {
            config.layout = gf2m::parseMinPolyLayout(layout_name);
        }
        if (!tables.empty()) {
            config.tables = tables;
        }

        for (const auto& spec : config.fields) {
            gf2m::FieldTable table = spec.build();
            gf2m::printFieldReport(std::cout, spec.name, table, config.tables, config.layout);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
