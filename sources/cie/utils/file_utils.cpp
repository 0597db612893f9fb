//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/utils/file_utils.hpp"
#include "cie/types.hpp"

#include <algorithm>

namespace cie::file_utils {

    namespace {
        bool is_source_file(const fs::path& path) {
            return language_from_path(path) != Language::Unknown;
        }
    }

    Result<std::vector<fs::path>, Error> collect_sources(const std::vector<fs::path>& inputs) {
        std::vector<fs::path> result;

        for (const auto& input : inputs) {
            std::error_code ec;

            if (!fs::exists(input, ec)) {
                return Result<std::vector<fs::path>, Error>::failure(
                    Error::not_found("Input not found", input.string())
                );
            }

            if (fs::is_regular_file(input, ec)) {
                result.push_back(input);
                continue;
            }

            for (const auto& entry : fs::recursive_directory_iterator(input, ec)) {
                if (entry.is_regular_file() && is_source_file(entry.path())) {
                    result.push_back(entry.path());
                }
            }

            if (ec) {
                return Result<std::vector<fs::path>, Error>::failure(
                    Error::io_error("Failed to list directory", input.string())
                );
            }
        }

        std::ranges::sort(result);
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return Result<std::vector<fs::path>, Error>::success(std::move(result));
    }

}  // namespace cie::file_utils
