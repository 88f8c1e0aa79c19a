#include "graph/Types.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace flowgraph {

// === Free functions ===

std::string dataTypeToString(DataType type) {
    switch (type) {
        case DataType::Any:    return "any";
        case DataType::Int:    return "int";
        case DataType::Double: return "double";
        case DataType::String: return "string";
        case DataType::Bool:   return "bool";
    }
    return "unknown";
}

DataType stringToDataType(const std::string& str) {
    if (str == "any")    return DataType::Any;
    if (str == "int")    return DataType::Int;
    if (str == "double") return DataType::Double;
    if (str == "string") return DataType::String;
    if (str == "bool")   return DataType::Bool;
    throw std::invalid_argument("Unknown data type: " + str);
}

bool isDataTypeCompatible(DataType a, DataType b) {
    if (a == DataType::Any || b == DataType::Any) {
        return true;
    }
    return a == b;
}

std::string graphCategoryToString(GraphCategory category) {
    switch (category) {
        case GraphCategory::ControlFlow: return "control_flow";
        case GraphCategory::DataFlow:    return "data_flow";
    }
    return "unknown";
}

GraphCategory stringToGraphCategory(const std::string& str) {
    if (str == "control_flow") return GraphCategory::ControlFlow;
    if (str == "data_flow")    return GraphCategory::DataFlow;
    throw std::invalid_argument("Unknown graph category: " + str);
}

std::string nodeStateToString(NodeState state) {
    switch (state) {
        case NodeState::Normal:    return "normal";
        case NodeState::Executing: return "executing";
        case NodeState::Success:   return "success";
        case NodeState::Error:     return "error";
    }
    return "unknown";
}

std::string generateId() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = engine();
        lo = engine();
    }

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

// === PinValue ===

PinValue::PinValue()
    : m_value(std::monostate{}) {}

PinValue::PinValue(int value)
    : m_value(static_cast<int64_t>(value)) {}

PinValue::PinValue(int64_t value)
    : m_value(value) {}

PinValue::PinValue(double value)
    : m_value(value) {}

PinValue::PinValue(const std::string& value)
    : m_value(value) {}

PinValue::PinValue(const char* value)
    : m_value(std::string(value)) {}

PinValue::PinValue(bool value)
    : m_value(value) {}

DataType PinValue::getType() const {
    if (std::holds_alternative<int64_t>(m_value))     return DataType::Int;
    if (std::holds_alternative<double>(m_value))      return DataType::Double;
    if (std::holds_alternative<std::string>(m_value)) return DataType::String;
    if (std::holds_alternative<bool>(m_value))        return DataType::Bool;
    return DataType::Any;
}

int64_t PinValue::getInt() const {
    if (auto v = std::get_if<int64_t>(&m_value)) {
        return *v;
    }
    if (auto v = std::get_if<double>(&m_value)) {
        return static_cast<int64_t>(*v);
    }
    if (auto v = std::get_if<bool>(&m_value)) {
        return *v ? 1 : 0;
    }
    if (auto v = std::get_if<std::string>(&m_value)) {
        return std::stoll(*v);
    }
    throw std::runtime_error("Cannot get int from null value");
}

double PinValue::getDouble() const {
    if (auto v = std::get_if<double>(&m_value)) {
        return *v;
    }
    if (auto v = std::get_if<int64_t>(&m_value)) {
        return static_cast<double>(*v);
    }
    if (auto v = std::get_if<std::string>(&m_value)) {
        return std::stod(*v);
    }
    throw std::runtime_error("Cannot get double from type: " + dataTypeToString(getType()));
}

const std::string& PinValue::getString() const {
    if (auto v = std::get_if<std::string>(&m_value)) {
        return *v;
    }
    throw std::runtime_error("Cannot get string from type: " + dataTypeToString(getType()));
}

bool PinValue::getBool() const {
    if (auto v = std::get_if<bool>(&m_value)) {
        return *v;
    }
    if (auto v = std::get_if<int64_t>(&m_value)) {
        return *v != 0;
    }
    throw std::runtime_error("Cannot get bool from type: " + dataTypeToString(getType()));
}

bool PinValue::isNull() const {
    return std::holds_alternative<std::monostate>(m_value);
}

bool PinValue::isNumeric() const {
    return std::holds_alternative<int64_t>(m_value) || std::holds_alternative<double>(m_value);
}

std::string PinValue::toString() const {
    if (auto v = std::get_if<int64_t>(&m_value))     return std::to_string(*v);
    if (auto v = std::get_if<std::string>(&m_value)) return *v;
    if (auto v = std::get_if<bool>(&m_value))        return *v ? "true" : "false";
    if (auto v = std::get_if<double>(&m_value)) {
        std::ostringstream oss;
        oss << *v;
        return oss.str();
    }
    return "null";
}

} // namespace flowgraph
