//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/core/config.hpp"
#include "cie/utils/file_utils.hpp"
#include "cie/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <regex>
#include <sstream>

namespace cie::core
{
    namespace {
        Result<void> read_string_array(const toml::node_view<toml::node> node,
                                       const std::string& key,
                                       std::vector<std::string>& out) {
            if (!node) {
                return Result<void>::success();
            }
            const auto* array = node.as_array();
            if (!array) {
                return Result<void>::failure(Error::config_error("Expected an array of strings", key));
            }

            std::vector<std::string> values;
            for (const auto& element : *array) {
                const auto value = element.value<std::string>();
                if (!value) {
                    return Result<void>::failure(Error::config_error("Expected an array of strings", key));
                }
                values.push_back(*value);
            }
            out = std::move(values);
            return Result<void>::success();
        }

        template<typename T>
        Result<void> read_non_negative(const toml::node_view<toml::node> node,
                                       const std::string& key,
                                       T& out) {
            if (!node) {
                return Result<void>::success();
            }
            const auto value = node.value<std::int64_t>();
            if (!value || *value < 0) {
                return Result<void>::failure(Error::config_error("Expected a non-negative integer", key));
            }
            out = static_cast<T>(*value);
            return Result<void>::success();
        }

        toml::array to_toml_array(const std::vector<std::string>& values) {
            toml::array array;
            for (const auto& value : values) {
                array.push_back(value);
            }
            return array;
        }
    }

    Result<Config> Config::load_from_file(const std::string& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config>::failure(content.error());
        }
        return load_from_string(content.value())
            .map_error([&path](Error&& error) { return error.with_context(path); });
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::config_error("Failed to parse TOML configuration", std::string(err.description())));
        }

        Config config;

        std::array<Result<void>, 7> reads = {
            read_non_negative(tbl["analysis"]["worker_threads"], "analysis.worker_threads",
                              config.analysis.worker_threads),
            read_non_negative(tbl["complexity"]["medium_threshold"], "complexity.medium_threshold",
                              config.heuristics.complexity.medium_threshold),
            read_non_negative(tbl["complexity"]["high_threshold"], "complexity.high_threshold",
                              config.heuristics.complexity.high_threshold),
            read_non_negative(tbl["linker"]["large_call_count"], "linker.large_call_count",
                              config.heuristics.linker.large_call_count),
            read_string_array(tbl["linker"]["entry_point_patterns"], "linker.entry_point_patterns",
                              config.heuristics.linker.entry_point_patterns),
            read_string_array(tbl["calls"]["system_call_names"], "calls.system_call_names",
                              config.heuristics.calls.system_call_names),
            read_string_array(tbl["calls"]["ignored_callees"], "calls.ignored_callees",
                              config.heuristics.calls.ignored_callees)
        };
        for (const auto& read : reads) {
            if (read.is_err()) {
                return Result<Config>::failure(read.error());
            }
        }

        if (const auto language = tbl["analysis"]["default_language"].value<std::string>()) {
            const auto parsed = language_from_string(*language);
            if (!parsed) {
                return Result<Config>::failure(
                    Error::config_error("Unknown language", "analysis.default_language=" + *language));
            }
            config.analysis.default_language = *parsed;
        }

        if (const auto level = tbl["logging"]["level"].value<std::string>()) {
            config.logging.level = *level;
        }
        if (const auto pattern = tbl["logging"]["pattern"].value<std::string>()) {
            config.logging.pattern = *pattern;
        }
        if (const auto file = tbl["logging"]["file"].value<std::string>()) {
            config.logging.file = *file;
        }

        if (auto validation_result = config.validate(); validation_result.is_err()) {
            return Result<Config>::failure(validation_result.error());
        }

        return Result<Config>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        const auto& complexity = heuristics.complexity;
        if (complexity.medium_threshold < 1) {
            errors.emplace_back("complexity.medium_threshold must be at least 1");
        }
        if (complexity.high_threshold < complexity.medium_threshold) {
            errors.emplace_back("complexity.high_threshold must not be below medium_threshold");
        }

        for (const auto& pattern : heuristics.linker.entry_point_patterns) {
            try {
                std::regex compiled(pattern);
            } catch (const std::regex_error&) {
                errors.emplace_back("invalid entry point pattern: " + pattern);
            }
        }

        if (std::ranges::any_of(heuristics.calls.system_call_names,
                                [](const std::string& name) { return name.empty(); })) {
            errors.emplace_back("calls.system_call_names must not contain empty names");
        }

        static constexpr std::array<std::string_view, 7> levels = {
            "trace", "debug", "info", "warning", "error", "critical", "off"
        };
        const std::string level = string_utils::to_lower(logging.level);
        if (std::ranges::find(levels, level) == levels.end() && level != "warn" && level != "err") {
            errors.emplace_back("unknown logging.level: " + logging.level);
        }

        if (!errors.empty()) {
            return Result<void>::failure(
                Error::config_error("Configuration validation failed", string_utils::join(errors, "; ")));
        }

        return Result<void>::success();
    }

    std::string Config::to_string() const {
        toml::table root;

        root.insert("analysis", toml::table{
            {"worker_threads", static_cast<std::int64_t>(analysis.worker_threads)},
            {"default_language", std::string(cie::to_string(analysis.default_language))}
        });
        root.insert("complexity", toml::table{
            {"medium_threshold", static_cast<std::int64_t>(heuristics.complexity.medium_threshold)},
            {"high_threshold", static_cast<std::int64_t>(heuristics.complexity.high_threshold)}
        });
        root.insert("linker", toml::table{
            {"entry_point_patterns", to_toml_array(heuristics.linker.entry_point_patterns)},
            {"large_call_count", static_cast<std::int64_t>(heuristics.linker.large_call_count)}
        });
        root.insert("calls", toml::table{
            {"system_call_names", to_toml_array(heuristics.calls.system_call_names)},
            {"ignored_callees", to_toml_array(heuristics.calls.ignored_callees)}
        });
        root.insert("logging", toml::table{
            {"level", logging.level},
            {"pattern", logging.pattern},
            {"file", logging.file}
        });

        std::ostringstream ss;
        ss << root;
        return ss.str();
    }

}  // namespace cie::core
