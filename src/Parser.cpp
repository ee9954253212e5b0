/**
 * @file Parser.cpp
 * @brief Implementation of the RAS line-oriented parser
 */

#include "ras/Parser.hpp"
#include "ras/Coerce.hpp"
#include <sstream>

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

    bool is_list_open(const std::string& line) {
        return line.size() > 1 && line.back() == '-' && line.front() != '+';
    }

    bool is_list_close(const std::string& line) {
        return line == "+";
    }

    /**
     * @brief Parser state: the open list (if any) and its pending body
     */
    struct RasParser {
        ParsedStore store;
        std::string current_list;
        bool list_open = false;
        std::string body;

        void open_list(const std::string& name) {
            finalize();
            current_list = name;
            list_open = true;
        }

        // Empty bodies are not stored, so an empty reopen keeps the earlier list.
        void finalize() {
            if (list_open && !body.empty()) {
                store[current_list] = tokenize_body(body);
            }
            current_list.clear();
            list_open = false;
            body.clear();
        }

        void add_body_line(std::string line) {
            auto hash = line.find('#');
            if (hash != std::string::npos) {
                line = trim(line.substr(0, hash));
            }
            if (!line.empty()) {
                body += line;
                body += '\n';
            }
        }

        void feed(const std::string& raw_line) {
            std::string line = trim(raw_line);

            if (!line.empty() && line.front() == '#') {
                return;
            }

            if (is_list_open(line)) {
                open_list(line.substr(0, line.size() - 1));
            } else if (is_list_close(line)) {
                finalize();
            } else if (list_open && !line.empty()) {
                add_body_line(line);
            }
        }
    };
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    if (line.empty()) {
        return fields;
    }

    std::string field;
    bool in_quotes = false;
    bool at_field_start = true;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (at_field_start && (c == ' ' || c == '\t')) {
            continue;
        }

        if (in_quotes) {
            field += c;
            if (c == '"') {
                // "" inside a quoted segment does not close it
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += line[++i];
                } else {
                    in_quotes = false;
                }
            }
        } else if (c == '"' && at_field_start) {
            in_quotes = true;
            field += c;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            at_field_start = true;
            continue;
        } else {
            field += c;
        }
        at_field_start = false;
    }
    fields.push_back(std::move(field));

    return fields;
}

List tokenize_body(const std::string& body) {
    List records;
    std::istringstream iss(body);
    std::string line;
    while (std::getline(iss, line)) {
        auto fields = split_fields(line);
        if (fields.empty()) {
            continue;
        }

        Record record;
        record.reserve(fields.size());
        for (const auto& field : fields) {
            record.push_back(coerce_value(field));
        }
        records.push_back(std::move(record));
    }
    return records;
}

ParsedStore parse(const std::string& document) {
    RasParser parser;

    std::istringstream iss(document);
    std::string line;
    while (std::getline(iss, line)) {
        parser.feed(line);
    }

    // Unclosed list at end of input
    parser.finalize();

    return std::move(parser.store);
}

} // namespace ras
