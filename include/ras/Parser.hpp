/**
 * @file Parser.hpp
 * @brief RAS document parser
 *
 * A RAS document is line oriented:
 *
 * ```
 * # comment line
 * products-
 * product1,"The first item",1,"tbh"   # inline comment
 * item_2,"Another Item, with a comma",42,"done"
 * +
 * ```
 *
 * - Comment line: trimmed line starting with '#'
 * - List open: "<name>-" (length > 1, not starting with '+')
 * - List close: "+" alone on a line
 * - Body line: comma-separated fields, one record per line
 *
 * Parsing is pure: the parser takes already-read text and returns an
 * independent ParsedStore. File access lives in Loader.hpp.
 */

#ifndef RAS_PARSER_HPP
#define RAS_PARSER_HPP

#include "ras/Value.hpp"
#include <map>
#include <string>
#include <vector>

namespace ras {

/// One data line of a list, fields in written order
using Record = std::vector<Value>;

/// Records of one list, in written order
using List = std::vector<Record>;

/// List name → records. A repeated list name replaces the earlier list.
using ParsedStore = std::map<std::string, List>;

/**
 * @brief Parse a whole RAS document
 *
 * Line handling, in order:
 * 1. Trim the line.
 * 2. Lines starting with '#' are dropped.
 * 3. "<name>-" opens a list, finalizing any list still open.
 * 4. "+" finalizes the open list.
 * 5. Any other non-empty line inside a list is a body line: it is cut at
 *    the first '#' (quoted or not), re-trimmed, and kept if non-empty.
 * Lines outside a list are ignored. A list still open at the end of the
 * input is finalized as if closed. A list with no body lines is not
 * stored.
 *
 * Never throws on malformed content; odd lines yield best-effort records.
 *
 * @param document Full document text
 * @return Parsed store
 */
ParsedStore parse(const std::string& document);

/**
 * @brief Split one record line into raw field strings
 *
 * Commas separate fields except inside a double-quoted segment. A quote
 * opens a segment only as the first character of a field; elsewhere it is
 * ordinary text. Inside a segment "" does not close it. Quote characters
 * are kept in the field text (coerce_value strips them). Spaces and tabs
 * directly after a comma are skipped.
 *
 * Examples:
 * - `a,b` → [`a`, `b`]
 * - `x, "y, z",1` → [`x`, `"y, z"`, `1`]
 * - `a,,b` → [`a`, ``, `b`]
 * - `tv,5" screen,42` → [`tv`, `5" screen`, `42`]
 * - `` → []
 *
 * @param line One body line, already comment-stripped
 * @return Raw fields in order
 */
std::vector<std::string> split_fields(const std::string& line);

/**
 * @brief Tokenize and coerce an accumulated list body
 *
 * @param body Body lines joined with '\n'
 * @return One Record per non-empty line
 */
List tokenize_body(const std::string& body);

} // namespace ras

#endif // RAS_PARSER_HPP
