/**
 * @file Converter.hpp
 * @brief Conversion of parsed RAS data to other formats
 *
 * JSON is the only supported target. The encoding itself is delegated to
 * nlohmann::json; this layer only maps the store shape:
 *
 * ```
 * {"products": [["product1", "The first item", 1, "tbh"]],
 *  "prices":   [["milk", 2.99]]}
 * ```
 */

#ifndef RAS_CONVERTER_HPP
#define RAS_CONVERTER_HPP

#include "ras/Parser.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ras {

/**
 * @brief Options for convert().
 */
struct ConvertOptions {
    int indent = 4; // JSON indentation; negative for compact single-line output
};

/**
 * @brief Map a store to a JSON object of arrays of arrays of scalars
 */
nlohmann::json to_json(const ParsedStore& store);

/**
 * @brief Serialize a store as JSON text
 * @param store Parsed store
 * @param indent Indentation width (negative = compact)
 */
std::string dump_json(const ParsedStore& store, int indent = 4);

/**
 * @brief Check whether a conversion target name is supported
 *
 * Comparison is case-insensitive ("json", "JSON", "Json").
 */
bool is_supported_format(const std::string& format);

/**
 * @brief Convert a RAS file to another format and write the result
 *
 * The input is read and parsed first, then the format is checked. On any
 * failure nothing is written.
 *
 * @param input_path RAS file to read
 * @param format Target format name (only "json")
 * @param output_path Destination file
 * @param opts Output options
 * @throws FileNotFoundError if input_path doesn't exist
 * @throws UnsupportedFormatError if format is not JSON
 * @throws IOError if reading input or writing output fails
 */
void convert(const std::string& input_path, const std::string& format,
             const std::string& output_path, const ConvertOptions& opts = {});

} // namespace ras

#endif // RAS_CONVERTER_HPP
