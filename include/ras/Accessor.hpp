/**
 * @file Accessor.hpp
 * @brief Bounds-checked positional lookup into parsed RAS data
 *
 * A value is addressed by (list name, record index, field index), both
 * indices zero-based. Field 0 is conventionally the record's key.
 *
 * Examples:
 * ```cpp
 * ParsedStore store = parse("products-\nproduct1,\"The first item\",1\n+\n");
 * get(store, "products", 0, 2);   // → 1 (integer)
 * get(store, "products", 9, 0);   // Throws IndexOutOfRangeError
 * get(store, "missing", 0, 0);    // Throws ListNotFoundError
 * get("data.ras", "products", 0, 0); // Reads and parses the file first
 * ```
 */

#ifndef RAS_ACCESSOR_HPP
#define RAS_ACCESSOR_HPP

#include "ras/Parser.hpp"
#include "ras/Value.hpp"
#include <string>

namespace ras {

/**
 * @brief Look up a value in a pre-parsed store
 *
 * Preferred for repeated lookups: the store is parsed once by the caller.
 *
 * @param store Parsed store
 * @param list_name List to read
 * @param record_index Zero-based record index
 * @param field_index Zero-based field index within the record
 * @return Reference to the value inside store
 * @throws ListNotFoundError if list_name is absent
 * @throws IndexOutOfRangeError if record_index < 0 or >= record count
 * @throws IndexOutOfRangeError if field_index < 0 or >= field count
 */
const Value& get(const ParsedStore& store, const std::string& list_name,
                 long long record_index, long long field_index);

/**
 * @brief Lookup into a temporary store is rejected
 *
 * The returned reference would point into a store destroyed at the end
 * of the full expression. Keep the store in a variable, or use the path
 * overload, which returns by value.
 */
const Value& get(ParsedStore&& store, const std::string& list_name,
                 long long record_index, long long field_index) = delete;

/**
 * @brief Read and parse a RAS file, then look up a value
 *
 * @param path RAS file path
 * @return Copy of the value (the parsed store is discarded)
 * @throws FileNotFoundError if path doesn't exist
 * @throws IOError if the file cannot be read
 * @throws ListNotFoundError, IndexOutOfRangeError as for the store overload
 */
Value get(const std::string& path, const std::string& list_name,
          long long record_index, long long field_index);

} // namespace ras

#endif // RAS_ACCESSOR_HPP
