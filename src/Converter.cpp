/**
 * @file Converter.cpp
 * @brief Implementation of RAS → JSON conversion
 */

#include "ras/Converter.hpp"
#include "ras/Errors.hpp"
#include "ras/Loader.hpp"
#include <algorithm>
#include <cctype>

namespace ras {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}

nlohmann::json to_json(const ParsedStore& store) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, records] : store) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& record : records) {
            // Value → JSON scalar through ras::to_json(json&, const Value&)
            arr.push_back(nlohmann::json(record));
        }
        out[name] = std::move(arr);
    }
    return out;
}

std::string dump_json(const ParsedStore& store, int indent) {
    return to_json(store).dump(indent);
}

bool is_supported_format(const std::string& format) {
    return to_lower(format) == "json";
}

void convert(const std::string& input_path, const std::string& format,
             const std::string& output_path, const ConvertOptions& opts) {
    ParsedStore store = load_file(input_path);

    if (!is_supported_format(format)) {
        throw UnsupportedFormatError(format);
    }

    write_text_file(output_path, dump_json(store, opts.indent) + "\n");
}

} // namespace ras
