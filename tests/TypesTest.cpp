#include <catch2/catch.hpp>
#include "graph/Types.hpp"
#include <set>

using namespace flowgraph;

// =============================================================================
// Enum conversions
// =============================================================================

TEST_CASE("DataType string round trip", "[Types]") {
    for (auto type : {DataType::Any, DataType::Int, DataType::Double, DataType::String, DataType::Bool}) {
        REQUIRE(stringToDataType(dataTypeToString(type)) == type);
    }
    REQUIRE(dataTypeToString(DataType::Double) == "double");
    REQUIRE_THROWS_AS(stringToDataType("float"), std::invalid_argument);
}

TEST_CASE("GraphCategory string conversion", "[Types]") {
    REQUIRE(graphCategoryToString(GraphCategory::ControlFlow) == "control_flow");
    REQUIRE(graphCategoryToString(GraphCategory::DataFlow) == "data_flow");
    REQUIRE(stringToGraphCategory("data_flow") == GraphCategory::DataFlow);
    REQUIRE_THROWS_AS(stringToGraphCategory("event"), std::invalid_argument);
}

TEST_CASE("DataType compatibility", "[Types]") {
    REQUIRE(isDataTypeCompatible(DataType::Int, DataType::Int));
    REQUIRE(isDataTypeCompatible(DataType::Any, DataType::String));
    REQUIRE(isDataTypeCompatible(DataType::Bool, DataType::Any));
    REQUIRE_FALSE(isDataTypeCompatible(DataType::Int, DataType::Double));
    REQUIRE_FALSE(isDataTypeCompatible(DataType::String, DataType::Bool));
}

// =============================================================================
// PinValue
// =============================================================================

TEST_CASE("PinValue default is null", "[Types][PinValue]") {
    PinValue v;
    REQUIRE(v.isNull());
    REQUIRE_FALSE(v.isNumeric());
    REQUIRE(v.toString() == "null");
    REQUIRE_THROWS_AS(v.getInt(), std::runtime_error);
}

TEST_CASE("PinValue typed construction", "[Types][PinValue]") {
    REQUIRE(PinValue(42).getType() == DataType::Int);
    REQUIRE(PinValue(int64_t(7)).getInt() == 7);
    REQUIRE(PinValue(2.5).getType() == DataType::Double);
    REQUIRE(PinValue("abc").getType() == DataType::String);
    REQUIRE(PinValue(std::string("abc")).getString() == "abc");
    REQUIRE(PinValue(true).getType() == DataType::Bool);
}

TEST_CASE("PinValue numeric conversions", "[Types][PinValue]") {
    REQUIRE(PinValue(3).getDouble() == 3.0);
    REQUIRE(PinValue(3.9).getInt() == 3);
    REQUIRE(PinValue(true).getInt() == 1);
    REQUIRE(PinValue(0).getBool() == false);
    REQUIRE(PinValue(5).getBool() == true);
    REQUIRE(PinValue(1).isNumeric());
    REQUIRE(PinValue(1.5).isNumeric());
    REQUIRE_FALSE(PinValue("1").isNumeric());
}

TEST_CASE("PinValue accessor mismatch throws", "[Types][PinValue]") {
    REQUIRE_THROWS_AS(PinValue(1).getString(), std::runtime_error);
    REQUIRE_THROWS_AS(PinValue("x").getBool(), std::runtime_error);
    REQUIRE_THROWS_AS(PinValue(true).getDouble(), std::runtime_error);
}

TEST_CASE("PinValue equality and rendering", "[Types][PinValue]") {
    REQUIRE(PinValue(1) == PinValue(int64_t(1)));
    REQUIRE(PinValue(1) != PinValue(1.0));
    REQUIRE(PinValue() == PinValue());
    REQUIRE(PinValue(12).toString() == "12");
    REQUIRE(PinValue(false).toString() == "false");
    REQUIRE(PinValue("hi").toString() == "hi");
}

// =============================================================================
// Identifiers
// =============================================================================

TEST_CASE("generateId produces distinct UUIDs", "[Types]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = generateId();
        REQUIRE(id.size() == 36);
        REQUIRE(id[14] == '4');
        ids.insert(id);
    }
    REQUIRE(ids.size() == 100);
}
