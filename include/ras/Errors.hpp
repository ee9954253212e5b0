/**
 * @file Errors.hpp
 * @brief Exception types for RAS parsing, lookup and conversion
 *
 * Error taxonomy:
 * - RasError: Base class
 * - NotFoundError: Something named by the caller does not exist
 *   - FileNotFoundError: Input file missing
 *   - ListNotFoundError: List name absent from a parsed store
 * - IndexOutOfRangeError: Record or field index outside bounds
 * - UnsupportedFormatError: Conversion target other than JSON
 * - IOError: Read/write failure on an existing path
 * - ValueTypeError: Typed accessor used on the wrong Value kind
 * - UnrepresentableValueError: Store cannot be written back as RAS text
 *
 * Coercion never throws; malformed fields fall back to String.
 */

#ifndef RAS_ERRORS_HPP
#define RAS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ras {

/**
 * @brief Base class for all RAS exceptions
 */
class RasError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A file or list requested by the caller does not exist
 */
class NotFoundError : public RasError {
public:
    using RasError::RasError;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public NotFoundError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : NotFoundError("RAS file not found: '" + path + "'")
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief List name absent from a parsed store
 */
class ListNotFoundError : public NotFoundError {
public:
    explicit ListNotFoundError(std::string list_name)
        : NotFoundError("List '" + list_name + "' not found in data store")
        , list_name_(std::move(list_name))
    {}

    const std::string& list_name() const noexcept {
        return list_name_;
    }

private:
    std::string list_name_;
};

/**
 * @brief Record or field index outside valid bounds
 *
 * what_kind() is "record" or "field"; size() is the number of records in
 * the list or fields in the record at the time of the lookup.
 */
class IndexOutOfRangeError : public RasError {
public:
    /**
     * @brief Construct with the kind of index, the index and the bound
     * @param what_kind "record" or "field"
     * @param index Offending index (may be negative)
     * @param size Number of valid positions
     */
    IndexOutOfRangeError(std::string what_kind, long long index, std::size_t size)
        : RasError(format_message(what_kind, index, size))
        , what_kind_(std::move(what_kind))
        , index_(index)
        , size_(size)
    {}

    const std::string& what_kind() const noexcept {
        return what_kind_;
    }

    long long index() const noexcept {
        return index_;
    }

    std::size_t size() const noexcept {
        return size_;
    }

private:
    std::string what_kind_;
    long long index_;
    std::size_t size_;

    static std::string format_message(const std::string& what_kind,
                                      long long index, std::size_t size) {
        return "Index out of range: " + what_kind + " index " +
               std::to_string(index) + " (size " + std::to_string(size) + ")";
    }
};

/**
 * @brief Conversion requested to a format other than JSON
 */
class UnsupportedFormatError : public RasError {
public:
    explicit UnsupportedFormatError(std::string format)
        : RasError("Unsupported data type for conversion: '" + format +
                   "'. Currently only 'json' is supported.")
        , format_(std::move(format))
    {}

    const std::string& format() const noexcept {
        return format_;
    }

private:
    std::string format_;
};

/**
 * @brief Underlying read or write failure
 */
class IOError : public RasError {
public:
    /**
     * @brief Construct with path and failure details
     * @param path File being read or written
     * @param details What went wrong
     */
    IOError(std::string path, std::string details)
        : RasError("I/O error on '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Typed accessor called on a Value of another kind
 */
class ValueTypeError : public RasError {
public:
    ValueTypeError(std::string expected, std::string actual)
        : RasError("Value is " + actual + ", expected " + expected)
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Store content that RAS text has no way to express
 *
 * Raised by the serializer for strings containing quotes, '#' or line
 * breaks, non-finite floats, and list names that would not read back.
 */
class UnrepresentableValueError : public RasError {
public:
    explicit UnrepresentableValueError(std::string details)
        : RasError("Cannot represent in RAS: " + details)
        , details_(std::move(details))
    {}

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string details_;
};

} // namespace ras

#endif // RAS_ERRORS_HPP
