/**
 * @file CliArgs.cpp
 * @brief Implementation of ras-cli argument helpers
 */

#include "ras/CliArgs.hpp"
#include <stdexcept>

namespace ras {

long long parse_index(const std::string& raw, const std::string& what) {
    size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(raw, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != raw.size()) {
        throw std::invalid_argument("invalid " + what + " index: '" + raw + "'");
    }
    return v;
}

} // namespace ras
