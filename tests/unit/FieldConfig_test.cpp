#include "src/field_config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "src/field_errors.hpp"

namespace {

using namespace gf2m;

std::string writeTempFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << contents;
    return path;
}

TEST(FieldConfig, ParsesAllFieldForms) {
    auto data = nlohmann::json::parse(R"json({
        "minpoly_layout": "coefficients",
        "tables": ["power", "add", "mul"],
        "fields": [
            {"name": "small", "polynomial": [1, 0, 1, 1]},
            {"order": 16},
            {"exponents": [5, 2, 0]}
        ]
    })json");
    FieldConfig config = parseFieldConfig(data);

    EXPECT_EQ(config.layout, MinPolyLayout::COEFFICIENTS);
    ASSERT_EQ(config.tables.size(), 3u);
    EXPECT_EQ(config.tables[0], TableKind::POWER);
    EXPECT_EQ(config.tables[1], TableKind::ADDITION);
    EXPECT_EQ(config.tables[2], TableKind::MULTIPLICATION);

    ASSERT_EQ(config.fields.size(), 3u);
    EXPECT_EQ(config.fields[0].name, "small");
    EXPECT_EQ(config.fields[0].degree, 3);
    EXPECT_EQ(config.fields[0].polynomial, 0xBu);
    EXPECT_EQ(config.fields[1].name, "GF(16)");
    EXPECT_EQ(config.fields[1].degree, 4);
    EXPECT_EQ(config.fields[1].polynomial, 0x13u);
    EXPECT_EQ(config.fields[2].name, "GF(2^5)");
    EXPECT_EQ(config.fields[2].polynomial, 0x25u);

    EXPECT_EQ(config.fields[2].build().order(), 32);
}

TEST(FieldConfig, Defaults) {
    FieldConfig config = parseFieldConfig(nlohmann::json::parse(R"json({"fields": [{"order": 8}]})json"));
    EXPECT_EQ(config.layout, MinPolyLayout::EXPONENTS);
    ASSERT_EQ(config.tables.size(), 2u);
    EXPECT_EQ(config.tables[0], TableKind::POWER);
    EXPECT_EQ(config.tables[1], TableKind::MINIMAL_POLYNOMIAL);
}

TEST(FieldConfig, UnknownTableIsSkippedWithWarning) {
    testing::internal::CaptureStderr();
    FieldConfig config =
        parseFieldConfig(nlohmann::json::parse(R"json({"tables": ["minpoly", "bogus"], "fields": []})json"));
    std::string err = testing::internal::GetCapturedStderr();
    ASSERT_EQ(config.tables.size(), 1u);
    EXPECT_EQ(config.tables[0], TableKind::MINIMAL_POLYNOMIAL);
    EXPECT_NE(err.find("Warning"), std::string::npos);
    EXPECT_NE(err.find("bogus"), std::string::npos);
}

TEST(FieldConfig, UnknownTopLevelKeyIsWarned) {
    testing::internal::CaptureStderr();
    FieldConfig config = parseFieldConfig(
        nlohmann::json::parse(R"json({"minpoly_layot": "coefficients", "fields": [{"order": 8}]})json"));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(config.layout, MinPolyLayout::EXPONENTS);
    ASSERT_EQ(config.fields.size(), 1u);
    EXPECT_NE(err.find("Warning"), std::string::npos);
    EXPECT_NE(err.find("minpoly_layot"), std::string::npos);
}

TEST(FieldConfig, KnownKeysProduceNoWarning) {
    testing::internal::CaptureStderr();
    parseFieldConfig(nlohmann::json::parse(
        R"json({"minpoly_layout": "exponents", "tables": ["power"], "fields": [{"name": "GF(8)", "order": 8}]})json"));
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(FieldConfig, WrongLengthPolynomialFailsWhenBuilt) {
    FieldConfig config =
        parseFieldConfig(nlohmann::json::parse(R"json({"fields": [{"polynomial": [0, 1, 0, 1, 1]}]})json"));
    ASSERT_EQ(config.fields.size(), 1u);
    EXPECT_EQ(config.fields[0].degree, 4);
    EXPECT_THROW(config.fields[0].build(), InvalidPolynomialError);
}

TEST(FieldConfig, RejectsBadEntries) {
    EXPECT_THROW(parseFieldConfig(nlohmann::json::parse(R"json({"fields": [{"order": 8, "exponents": [0, 1, 3]}]})json")),
                 std::runtime_error);
    EXPECT_THROW(parseFieldConfig(nlohmann::json::parse(R"json({"fields": [{"name": "none"}]})json")), std::runtime_error);
    EXPECT_THROW(parseFieldConfig(nlohmann::json::parse(R"json({"fields": [{"order": 12}]})json")), InvalidPolynomialError);
    EXPECT_THROW(parseFieldConfig(nlohmann::json::parse(R"json({"minpoly_layout": "sideways", "fields": []})json")),
                 std::invalid_argument);
    EXPECT_THROW(parseFieldConfig(nlohmann::json::parse("[1, 2]")), std::runtime_error);
}

TEST(FieldConfig, LoadsFromFile) {
    auto path = writeTempFile("gf2m_fields.json", R"json({"fields": [{"name": "GF(8)", "polynomial": [1, 0, 1, 1]}]})json");
    FieldConfig config = loadFieldConfig(path);
    ASSERT_EQ(config.fields.size(), 1u);
    EXPECT_EQ(config.fields[0].name, "GF(8)");
    EXPECT_EQ(config.fields[0].build().toVector(3), 0b011u);
}

TEST(FieldConfig, LoadErrorsNameThePath) {
    try {
        loadFieldConfig("/nonexistent/gf2m_fields.json");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/gf2m_fields.json"), std::string::npos);
    }

    auto bad = writeTempFile("gf2m_bad.json", "{\"fields\": [");
    EXPECT_THROW(loadFieldConfig(bad), std::runtime_error);

    auto missing = writeTempFile("gf2m_missing.json", "{}");
    EXPECT_THROW(loadFieldConfig(missing), std::runtime_error);
}

TEST(FieldConfig, ParsesFieldOrderText) {
    EXPECT_EQ(parseFieldOrder("16"), 16);
    EXPECT_EQ(parseFieldOrder("256"), 256);
    EXPECT_THROW(parseFieldOrder("abc"), std::invalid_argument);
    EXPECT_THROW(parseFieldOrder(""), std::invalid_argument);
    EXPECT_THROW(parseFieldOrder("16x"), std::invalid_argument);
    EXPECT_THROW(parseFieldOrder("99999999999999999999"), std::invalid_argument);
    try {
        parseFieldOrder("abc");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("abc"), std::string::npos);
    }
}

TEST(FieldConfig, LayoutAndTableNames) {
    EXPECT_EQ(parseMinPolyLayout("exponents"), MinPolyLayout::EXPONENTS);
    EXPECT_EQ(parseMinPolyLayout("polynomial"), MinPolyLayout::POLYNOMIAL);
    TableKind kind;
    EXPECT_TRUE(parseTableKind("mul", kind));
    EXPECT_EQ(kind, TableKind::MULTIPLICATION);
    EXPECT_FALSE(parseTableKind("div", kind));
}

}  // namespace
