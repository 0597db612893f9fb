//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_LOGGING_HPP
#define CIE_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Installs the process-wide "cie" spdlog logger.
 *
 * Library code logs through the spdlog default logger
 * (spdlog::debug/info/warn/error), so configure() only has to run once,
 * early in the host process. Without it spdlog's stock stdout logger is used.
 */

#include "cie/core/config.hpp"
#include "cie/result.hpp"

namespace cie::logging {

    /**
     * Creates the "cie" logger with a colored stderr sink and, when
     * config.file is set, a file sink, and makes it the default logger.
     *
     * @return ConfigError for an unknown level, IoError if the log file
     *         cannot be opened.
     */
    Result<void> configure(const core::LoggingConfig& config);

    /**
     * Sets the level of the default logger ("trace" ... "off").
     */
    Result<void> set_level(const std::string& level);

}  // namespace cie::logging

#endif //CIE_LOGGING_HPP
