/**
 * @file Accessor.cpp
 * @brief Implementation of positional lookup
 */

#include "ras/Accessor.hpp"
#include "ras/Errors.hpp"
#include "ras/Loader.hpp"

namespace ras {

namespace {
    bool in_bounds(long long index, std::size_t size) {
        return index >= 0 && static_cast<unsigned long long>(index) < size;
    }
}

const Value& get(const ParsedStore& store, const std::string& list_name,
                 long long record_index, long long field_index) {
    auto it = store.find(list_name);
    if (it == store.end()) {
        throw ListNotFoundError(list_name);
    }

    const List& records = it->second;
    if (!in_bounds(record_index, records.size())) {
        throw IndexOutOfRangeError("record", record_index, records.size());
    }

    const Record& record = records[static_cast<std::size_t>(record_index)];
    if (!in_bounds(field_index, record.size())) {
        throw IndexOutOfRangeError("field", field_index, record.size());
    }

    return record[static_cast<std::size_t>(field_index)];
}

Value get(const std::string& path, const std::string& list_name,
          long long record_index, long long field_index) {
    ParsedStore store = load_file(path);
    return get(store, list_name, record_index, field_index);
}

} // namespace ras
