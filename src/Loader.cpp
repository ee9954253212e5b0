/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "ras/Loader.hpp"
#include "ras/Errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ras {

namespace {

/**
 * @brief Describe the last C library error, or a fallback text.
 */
std::string errno_details(const std::string& fallback) {
    if (errno != 0) {
        return std::strerror(errno);
    }
    return fallback;
}

} // anonymous namespace

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_text_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError(path, errno_details("cannot open for reading"));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IOError(path, errno_details("read failed"));
    }
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError(path, errno_details("cannot open for writing"));
    }

    file << text;
    file.flush();
    if (!file) {
        throw IOError(path, errno_details("write failed"));
    }
}

ParsedStore load_file(const std::string& path) {
    return parse(read_text_file(path));
}

} // namespace ras
