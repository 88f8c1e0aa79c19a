#pragma once

#include <variant>
#include <string>
#include <cstdint>
#include <stdexcept>

namespace flowgraph {

/**
 * Data types carried by data pins
 *
 * Any is compatible with every other type (untyped pin).
 */
enum class DataType {
    Any,
    Int,
    Double,
    String,
    Bool
};

/**
 * Convert DataType to string for display/serialization
 */
std::string dataTypeToString(DataType type);

/**
 * Convert string to DataType (throws std::invalid_argument on unknown names)
 */
DataType stringToDataType(const std::string& str);

/**
 * Two data types are compatible when equal or when either side is Any
 */
bool isDataTypeCompatible(DataType a, DataType b);

enum class PinDirection {
    Input,
    Output
};

/**
 * Execution discipline of a graph
 */
enum class GraphCategory {
    ControlFlow,
    DataFlow
};

std::string graphCategoryToString(GraphCategory category);
GraphCategory stringToGraphCategory(const std::string& str);

/**
 * State of a node after its last evaluation step
 */
enum class NodeState {
    Normal,
    Executing,
    Success,
    Error
};

std::string nodeStateToString(NodeState state);

/**
 * Value storage using variant for type safety
 */
using ValueStorage = std::variant<
    std::monostate,   // Null
    int64_t,          // Int
    double,           // Double
    std::string,      // String
    bool              // Bool
>;

/**
 * Value held by a data pin
 *
 * A default-constructed PinValue is null. Accessors convert between
 * numeric types and throw std::runtime_error when no conversion exists.
 */
class PinValue {
public:
    PinValue();
    PinValue(int value);
    PinValue(int64_t value);
    PinValue(double value);
    PinValue(const std::string& value);
    PinValue(const char* value);
    PinValue(bool value);

    // Getters
    DataType getType() const;
    const ValueStorage& getValue() const { return m_value; }

    // Type-safe value extraction (throws on wrong type)
    int64_t getInt() const;
    double getDouble() const;
    const std::string& getString() const;
    bool getBool() const;

    bool isNull() const;
    bool isNumeric() const;

    /**
     * Human readable rendering ("null" for null values)
     */
    std::string toString() const;

    bool operator==(const PinValue& other) const { return m_value == other.m_value; }
    bool operator!=(const PinValue& other) const { return !(*this == other); }

private:
    ValueStorage m_value;
};

/**
 * Generate a new random identifier (UUID v4 format)
 */
std::string generateId();

} // namespace flowgraph
