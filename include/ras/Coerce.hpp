/**
 * @file Coerce.hpp
 * @brief Field-string to Value coercion
 *
 * Converts a single raw field, as produced by the record tokenizer, into
 * a typed Value. There is no schema: the kind is decided lexically.
 *
 * Coercion order (first match wins):
 * - C1: Quoted String ("..." with length > 1, one quote stripped per side)
 * - C2: Boolean ("True" / "False", case-sensitive)
 * - C3: Float if the field contains '.', otherwise Integer
 * - C4: Raw String (fallback when C3 does not parse)
 */

#ifndef RAS_COERCE_HPP
#define RAS_COERCE_HPP

#include "ras/Value.hpp"
#include <string>

namespace ras {

/**
 * @brief Coerce a raw field to a Value
 *
 * Total and pure: never throws, and every input maps to exactly one kind.
 * Numeric parsing is locale-independent ('.' is always the decimal
 * separator), tolerates surrounding whitespace and an explicit sign, and
 * requires the whole token to be consumed. Out-of-range numbers fall
 * back to String.
 *
 * @param field Raw field text, quotes included if the author wrote them
 * @return Coerced Value
 *
 * Examples:
 * ```cpp
 * coerce_value("\"The first item\"") // → "The first item" (string)
 * coerce_value("\"42\"")             // → "42" (string, quoted)
 * coerce_value("True")               // → true (boolean)
 * coerce_value("true")               // → "true" (string, case matters)
 * coerce_value("42")                 // → 42 (integer)
 * coerce_value("-007")               // → -7 (integer)
 * coerce_value("3.14")               // → 3.14 (float)
 * coerce_value("1.5e3")              // → 1500.0 (float)
 * coerce_value("1e3")                // → "1e3" (string, no '.')
 * coerce_value("product1")           // → "product1" (string)
 * coerce_value("")                   // → "" (string)
 * ```
 */
Value coerce_value(const std::string& field);

} // namespace ras

#endif // RAS_COERCE_HPP
