/**
 * @file Value.hpp
 * @brief Scalar value type for RAS fields
 *
 * Every field of a RAS record coerces to exactly one of four kinds:
 * - Boolean (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 *
 * There is no null and no container kind; lists and records are plain
 * std::vector containers of Value (see Parser.hpp).
 */

#ifndef RAS_VALUE_HPP
#define RAS_VALUE_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace ras {

/**
 * @brief Discriminator for the active alternative of a Value
 */
enum class ValueKind {
    Boolean,
    Integer,
    Float,
    String
};

/**
 * @brief Tagged scalar holding one Boolean, Integer, Float or String
 *
 * Construct through the named factories so that the kind is never
 * chosen by an implicit numeric conversion:
 *
 * ```cpp
 * Value b = Value::boolean(true);
 * Value i = Value::integer(42);
 * Value f = Value::floating(3.14);
 * Value s = Value::string("product1");
 * ```
 *
 * Consumers either switch on kind() or std::visit the storage().
 */
class Value {
public:
    using Storage = std::variant<bool, std::int64_t, double, std::string>;

    /// Default-constructed value is the empty String
    Value() : data_(std::string{}) {}

    static Value boolean(bool v) { return Value(Storage(v)); }
    static Value integer(std::int64_t v) { return Value(Storage(v)); }
    static Value floating(double v) { return Value(Storage(v)); }
    static Value string(std::string v) { return Value(Storage(std::move(v))); }

    ValueKind kind() const noexcept {
        return static_cast<ValueKind>(data_.index());
    }

    bool is_boolean() const noexcept { return kind() == ValueKind::Boolean; }
    bool is_integer() const noexcept { return kind() == ValueKind::Integer; }
    bool is_float() const noexcept { return kind() == ValueKind::Float; }
    bool is_string() const noexcept { return kind() == ValueKind::String; }
    bool is_number() const noexcept { return is_integer() || is_float(); }

    /**
     * @brief Typed accessors
     * @throws ValueTypeError if the value holds a different kind
     */
    bool as_bool() const;
    std::int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;

    /// Underlying variant, for std::visit
    const Storage& storage() const noexcept { return data_; }

    friend bool operator==(const Value& a, const Value& b) {
        return a.data_ == b.data_;
    }
    friend bool operator!=(const Value& a, const Value& b) {
        return !(a == b);
    }

private:
    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/**
 * @brief Human-readable kind name
 * @return "boolean", "integer", "float" or "string"
 */
std::string type_name(ValueKind kind);

inline std::string type_name(const Value& val) {
    return type_name(val.kind());
}

/**
 * @brief Convert a Value to its JSON scalar (found by nlohmann::json via ADL)
 */
void to_json(nlohmann::json& j, const Value& val);

/**
 * @brief Stream a Value in its JSON text form (strings quoted)
 *
 * Used by GoogleTest to print values in assertion failures.
 */
std::ostream& operator<<(std::ostream& os, const Value& val);

} // namespace ras

#endif // RAS_VALUE_HPP
