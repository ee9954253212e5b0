/**
 * @file Serializer.cpp
 * @brief Implementation of RAS text output
 */

#include "ras/Serializer.hpp"
#include "ras/Errors.hpp"
#include <cctype>
#include <cmath>
#include <nlohmann/json.hpp>
#include <sstream>

namespace ras {

namespace {
    /**
     * @brief Shortest round-trip text for a double, always with a '.'
     *
     * nlohmann::json already prints the shortest form ("3.5", "2.0",
     * "1e+20"); exponent forms get ".0" spliced in before the 'e'.
     */
    std::string format_float(double d) {
        if (!std::isfinite(d)) {
            throw UnrepresentableValueError("non-finite float");
        }
        std::string text = nlohmann::json(d).dump();
        if (text.find('.') == std::string::npos) {
            auto e = text.find_first_of("eE");
            if (e == std::string::npos) {
                text += ".0";
            } else {
                text.insert(e, ".0");
            }
        }
        return text;
    }

    void check_list_name(const std::string& name) {
        if (name.empty()) {
            throw UnrepresentableValueError("empty list name");
        }
        if (name.front() == '+' || name.front() == '#') {
            throw UnrepresentableValueError("list name '" + name +
                                            "' starts with a marker character");
        }
        if (name.find_first_of("\r\n") != std::string::npos) {
            throw UnrepresentableValueError("list name contains a line break");
        }
        if (std::isspace(static_cast<unsigned char>(name.front())) ||
            std::isspace(static_cast<unsigned char>(name.back()))) {
            throw UnrepresentableValueError("list name '" + name +
                                            "' has surrounding whitespace");
        }
    }
}

std::string format_field(const Value& val) {
    switch (val.kind()) {
        case ValueKind::Boolean:
            return val.as_bool() ? "True" : "False";
        case ValueKind::Integer:
            return std::to_string(val.as_int());
        case ValueKind::Float:
            return format_float(val.as_double());
        case ValueKind::String: {
            const std::string& s = val.as_string();
            if (s.find_first_of("\"#\r\n") != std::string::npos) {
                throw UnrepresentableValueError("string '" + s +
                                                "' contains a quote, '#' or line break");
            }
            return "\"" + s + "\"";
        }
    }
    return "";
}

std::string to_ras_string(const ParsedStore& store) {
    std::ostringstream oss;
    bool first_list = true;
    for (const auto& [name, records] : store) {
        check_list_name(name);
        if (!first_list) oss << "\n";
        first_list = false;

        oss << name << "-\n";
        for (const auto& record : records) {
            for (size_t i = 0; i < record.size(); ++i) {
                if (i > 0) oss << ",";
                oss << format_field(record[i]);
            }
            oss << "\n";
        }
        oss << "+\n";
    }
    return oss.str();
}

} // namespace ras
