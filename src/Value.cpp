/**
 * @file Value.cpp
 * @brief Implementation of Value accessors and JSON mapping
 */

#include "ras/Value.hpp"
#include "ras/Errors.hpp"

namespace ras {

bool Value::as_bool() const {
    if (!is_boolean()) {
        throw ValueTypeError("boolean", type_name(*this));
    }
    return std::get<bool>(data_);
}

std::int64_t Value::as_int() const {
    if (!is_integer()) {
        throw ValueTypeError("integer", type_name(*this));
    }
    return std::get<std::int64_t>(data_);
}

double Value::as_double() const {
    if (!is_float()) {
        throw ValueTypeError("float", type_name(*this));
    }
    return std::get<double>(data_);
}

const std::string& Value::as_string() const {
    if (!is_string()) {
        throw ValueTypeError("string", type_name(*this));
    }
    return std::get<std::string>(data_);
}

std::string type_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Value& val) {
    switch (val.kind()) {
        case ValueKind::Boolean:
            j = val.as_bool();
            break;
        case ValueKind::Integer:
            j = val.as_int();
            break;
        case ValueKind::Float:
            j = val.as_double();
            break;
        case ValueKind::String:
            j = val.as_string();
            break;
    }
}

std::ostream& operator<<(std::ostream& os, const Value& val) {
    nlohmann::json j = val;
    return os << j.dump();
}

} // namespace ras
