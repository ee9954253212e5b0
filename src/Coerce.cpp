/**
 * @file Coerce.cpp
 * @brief Implementation of field coercion
 */

#include "ras/Coerce.hpp"
#include <charconv>
#include <cstdint>
#include <system_error>

namespace ras {

namespace {
    /**
     * @brief Trim whitespace from both ends of string.
     */
    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n\f\v");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n\f\v");
        return s.substr(start, end - start + 1);
    }

    /**
     * @brief Drop an explicit '+' sign, which std::from_chars rejects.
     *
     * A sign followed by another sign is left alone so that "+-1" fails.
     */
    std::string strip_plus(const std::string& s) {
        if (s.size() > 1 && s[0] == '+' && s[1] != '+' && s[1] != '-') {
            return s.substr(1);
        }
        return s;
    }

    /**
     * @brief Parse the whole string as a signed 64-bit integer
     */
    bool parse_integer(const std::string& s, std::int64_t& out) {
        if (s.empty()) return false;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    }

    /**
     * @brief Parse the whole string as a double
     */
    bool parse_float(const std::string& s, double& out) {
        if (s.empty()) return false;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out, std::chars_format::general);
        return ec == std::errc() && ptr == last;
    }
}

Value coerce_value(const std::string& field) {
    // C1: Quoted String
    if (field.size() > 1 && field.front() == '"' && field.back() == '"') {
        return Value::string(field.substr(1, field.size() - 2));
    }

    // C2: Boolean
    if (field == "True") {
        return Value::boolean(true);
    }
    if (field == "False") {
        return Value::boolean(false);
    }

    // C3: Float or Integer, chosen by the presence of a decimal point
    std::string numeric = strip_plus(trim(field));
    if (field.find('.') != std::string::npos) {
        double val = 0.0;
        if (parse_float(numeric, val)) {
            return Value::floating(val);
        }
    } else {
        std::int64_t val = 0;
        if (parse_integer(numeric, val)) {
            return Value::integer(val);
        }
    }

    // C4: Raw String (unquoted identifier)
    return Value::string(field);
}

} // namespace ras
