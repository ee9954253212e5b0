/**
 * @file TempFile.hpp
 * @brief RAII temporary file and directory helpers shared by the tests
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef RAS_TESTS_TEMPFILE_HPP
#define RAS_TESTS_TEMPFILE_HPP

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace ras_test {

inline long current_process_id() {
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(getpid());
#endif
}

/**
 * @brief Fresh path under the GoogleTest temp directory
 *
 * The name carries the process id, the running test's suite and name, and
 * a per-process counter, so parallel test processes never share a path.
 */
inline std::filesystem::path unique_temp_path(const std::string& prefix,
                                              const std::string& extension = "") {
    static std::atomic<unsigned long> counter{0};

    std::string name = prefix + "_" + std::to_string(current_process_id());
    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += "_";
        name += info->test_suite_name();
        name += "_";
        name += info->name();
    }
    name += "_" + std::to_string(counter++) + extension;
    return std::filesystem::path(::testing::TempDir()) / name;
}

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content, const std::string& extension = ".ras")
        : path_(unique_temp_path("ras_test", extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(unique_temp_path("ras_test_dir")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

private:
    std::filesystem::path path_;
};

/// Sample document used across test files
inline const char* const kSampleDocument = R"(
# This is a comment for products list
products-
product1,"The first item",1,"tbh" # Inline comment
item_2,"Another Item, with a comma",42,"done"
+
# This is a comment for status list
status-
product1,True,45
# Another comment line
item_2,False,100
+
prices-
milk,2.99
bread,3.50
+
)";

} // namespace ras_test

#endif // RAS_TESTS_TEMPFILE_HPP
