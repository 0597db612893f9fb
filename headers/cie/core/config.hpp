//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_CORE_CONFIG_HPP
#define CIE_CORE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Engine configuration loaded from TOML.
 *
 * Example cie.toml:
 * @code
 *     [analysis]
 *     worker_threads = 4
 *     default_language = "rust"
 *
 *     [complexity]
 *     medium_threshold = 10
 *     high_threshold = 20
 *
 *     [linker]
 *     entry_point_patterns = ["^main$", ".*_init$"]
 *     large_call_count = 10
 *
 *     [calls]
 *     system_call_names = ["request_irq", "schedule"]
 *     ignored_callees = ["Some", "Ok", "Err"]
 *
 *     [logging]
 *     level = "info"
 * @endcode
 */

#include "cie/heuristics/config.hpp"
#include "cie/result.hpp"
#include "cie/types.hpp"

#include <string>

namespace cie::core {

    struct AnalysisConfig {
        /// 0 selects std::thread::hardware_concurrency()
        std::size_t worker_threads = 0;
        /// Used for files whose extension does not name a dialect
        Language default_language = Language::Unknown;
    };

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
        /// Empty logs to stderr only
        std::string file;
    };

    class Config {
    public:
        Config() = default;

        AnalysisConfig analysis;
        heuristics::HeuristicsConfig heuristics = heuristics::HeuristicsConfig::defaults();
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Missing keys keep their defaults.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * Checks thresholds, patterns and the log level.
         */
        [[nodiscard]] Result<void> validate() const;

        /**
         * Serializes the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace cie::core

#endif //CIE_CORE_CONFIG_HPP
