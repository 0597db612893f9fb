//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/utils/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace cie::logging {

    namespace {
        Result<spdlog::level::level_enum> parse_level(const std::string& level) {
            const auto parsed = spdlog::level::from_str(level);
            // from_str maps unknown names to "off"; only accept "off" when asked for.
            if (parsed == spdlog::level::off && level != "off") {
                return Result<spdlog::level::level_enum>::failure(
                    Error::config_error("Unknown log level", level));
            }
            return Result<spdlog::level::level_enum>::success(parsed);
        }
    }

    Result<void> configure(const core::LoggingConfig& config) {
        auto level = parse_level(config.level);
        if (level.is_err()) {
            return Result<void>::failure(level.error());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, true));
            } catch (const spdlog::spdlog_ex& ex) {
                return Result<void>::failure(Error::io_error(ex.what(), config.file));
            }
        }

        auto logger = std::make_shared<spdlog::logger>("cie", sinks.begin(), sinks.end());
        logger->set_pattern(config.pattern);
        logger->set_level(level.value());
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(std::move(logger));
        return Result<void>::success();
    }

    Result<void> set_level(const std::string& level) {
        auto parsed = parse_level(level);
        if (parsed.is_err()) {
            return Result<void>::failure(parsed.error());
        }
        spdlog::set_level(parsed.value());
        return Result<void>::success();
    }

}  // namespace cie::logging
