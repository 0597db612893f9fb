//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_STRING_UTILS_HPP
#define CIE_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used when rendering signatures, contexts and
 * search matches.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cie::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits text into lines. Accepts "\n" and "\r\n"; a trailing newline
     * does not produce an extra empty line.
     */
    inline std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < text.size()) {
            std::size_t end = text.find('\n', start);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            std::string_view line = text.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            lines.emplace_back(line);
            start = end + 1;
        }
        return lines;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Case-insensitive substring test. An empty needle never matches.
     */
    inline bool icontains(const std::string_view haystack, const std::string_view needle) {
        if (needle.empty()) {
            return false;
        }
        return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
    }

    /**
     * Cuts s to at most max_length characters, marking the cut with "...".
     */
    inline std::string truncate(const std::string_view s, const std::size_t max_length) {
        if (s.size() <= max_length) {
            return std::string(s);
        }
        if (max_length <= 3) {
            return std::string(s.substr(0, max_length));
        }
        return std::string(s.substr(0, max_length - 3)) + "...";
    }

}  // namespace cie::string_utils

#endif //CIE_STRING_UTILS_HPP
