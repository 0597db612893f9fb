//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_FILE_UTILS_HPP
#define CIE_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File reading and writing for the CLI front end.
 *
 * The engine itself never touches the file system; sources arrive as
 * (path, content) pairs. Only the command line tool reads files.
 */

#include "cie/result.hpp"
#include "cie/error.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cie::file_utils {

    namespace fs = std::filesystem;

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
     * Expands the inputs into source files. Directories are walked
     * recursively and only files with a known source extension are kept.
     * The result is sorted so corpus order is reproducible.
     */
    Result<std::vector<fs::path>, Error> collect_sources(const std::vector<fs::path>& inputs);

}  // namespace cie::file_utils

#endif //CIE_FILE_UTILS_HPP
