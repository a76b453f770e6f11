//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef STS_FILE_UTILS_HPP
#define STS_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading and writing files and reasoning about path containment. All
 * operations use Result<T, Error> for error handling.
 */

#include "sts/result.hpp"
#include "sts/error.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sts::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating missing parent directories.
     *
     * @param path Path to the file.
     * @param content Content to write.
     * @return Success or an error.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Resolves a path to an absolute, lexically normalized form.
     *
     * Symlinks are resolved for the existing prefix of the path, so a
     * not-yet-created output file still compares correctly against an
     * existing directory.
     */
    inline fs::path normalize(const fs::path& path) {
        std::error_code ec;
        auto resolved = fs::weakly_canonical(path, ec);
        if (ec) {
            resolved = fs::absolute(path, ec).lexically_normal();
        }
        return resolved;
    }

    /**
     * Checks whether @p path lies inside (or is) @p root.
     *
     * @param path Candidate path.
     * @param root Directory (or file) to test against.
     * @return True if @p path equals @p root or is below it.
     */
    inline bool is_within(const fs::path& path, const fs::path& root) {
        const auto p = normalize(path);
        const auto r = normalize(root);

        auto pit = p.begin();
        for (auto rit = r.begin(); rit != r.end(); ++rit, ++pit) {
            if (rit->empty()) {
                continue;   // trailing separator
            }
            if (pit == p.end() || *pit != *rit) {
                return false;
            }
        }
        return true;
    }

    /**
     * Checks if a path is a Python source file.
     */
    inline bool is_python_source(const fs::path& path) {
        return path.extension() == ".py";
    }

}  // namespace sts::file_utils

#endif //STS_FILE_UTILS_HPP
