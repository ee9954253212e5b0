/**
 * @file CliArgs.hpp
 * @brief Argument conversion helpers behind ras-cli
 */

#ifndef RAS_CLIARGS_HPP
#define RAS_CLIARGS_HPP

#include <string>

namespace ras {

/**
 * @brief Convert a command-line index argument to an integer
 *
 * The whole argument must be a base-10 integer, optionally signed. Range
 * checking against the data happens later in get().
 *
 * Examples:
 * - "2" → 2
 * - "-1" → -1 (rejected later by get() as out of range)
 * - "1x", "", "abc" → Throws
 *
 * @param raw Argument text as typed
 * @param what Index name used in the message ("record" or "field")
 * @return Parsed index
 * @throws std::invalid_argument if raw is not an integer that fits long long
 */
long long parse_index(const std::string& raw, const std::string& what);

} // namespace ras

#endif // RAS_CLIARGS_HPP
