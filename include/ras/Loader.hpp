/**
 * @file Loader.hpp
 * @brief File access boundary for RAS documents
 *
 * The parser works on text only. Everything touching the file system
 * (existence checks, reads, writes) is kept here so parse() stays pure.
 */

#ifndef RAS_LOADER_HPP
#define RAS_LOADER_HPP

#include "ras/Parser.hpp"
#include <string>

namespace ras {

/**
 * @brief Check whether a path names an existing regular file.
 *
 * Never throws; file system errors count as "does not exist".
 */
bool file_exists(const std::string& path);

/**
 * @brief Read an entire file into a string.
 *
 * @param path File to read
 * @return File contents, bytes unchanged
 * @throws FileNotFoundError if path is not an existing regular file
 * @throws IOError if the file exists but cannot be opened or read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Write a string to a file, replacing any previous contents.
 *
 * @param path Destination path (parent directory must exist)
 * @param text Contents to write
 * @throws IOError if the file cannot be opened or the write fails
 */
void write_text_file(const std::string& path, const std::string& text);

/**
 * @brief Read and parse a RAS file.
 *
 * @param path Path to the RAS file
 * @return Parsed store
 * @throws FileNotFoundError if the file doesn't exist
 * @throws IOError if the file cannot be read
 */
ParsedStore load_file(const std::string& path);

} // namespace ras

#endif // RAS_LOADER_HPP
