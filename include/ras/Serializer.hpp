/**
 * @file Serializer.hpp
 * @brief Writing parsed RAS data back as RAS text
 *
 * Output layout:
 *
 * ```
 * prices-
 * "milk",2.99
 * "bread",3.5
 * +
 * ```
 *
 * Strings are always quoted, so an unquoted identifier such as product1
 * reads back as the same String. Floats always carry a '.' so they read
 * back as Float, and booleans are written as True / False.
 */

#ifndef RAS_SERIALIZER_HPP
#define RAS_SERIALIZER_HPP

#include "ras/Parser.hpp"
#include "ras/Value.hpp"
#include <string>

namespace ras {

/**
 * @brief Format a single value as a RAS field
 * @throws UnrepresentableValueError for strings containing '"', '#', CR or
 *         LF, and for non-finite floats
 */
std::string format_field(const Value& val);

/**
 * @brief Serialize a whole store
 *
 * parse(to_ras_string(store)) == store for any store produced by parse()
 * whose lists are non-empty.
 *
 * @throws UnrepresentableValueError for values format_field() rejects and
 *         for list names that are empty, start with '+' or '#', contain CR
 *         or LF, or carry surrounding whitespace
 */
std::string to_ras_string(const ParsedStore& store);

} // namespace ras

#endif // RAS_SERIALIZER_HPP
