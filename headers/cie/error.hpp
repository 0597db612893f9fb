//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ERROR_HPP
#define CIE_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types and error handling utilities.
 *
 * Provides a structured error type that carries an error code, a message
 * and optional context. Works together with Result<T, Error> so that every
 * fallible stage of the analysis pipeline makes its failure path explicit.
 *
 * Error categories:
 * - None: No error (success state)
 * - InvalidArgument: Invalid function arguments or parameters
 * - NotFound: Unknown file, corpus or symbol
 * - ParseError: Source text could not be processed at all
 * - IoError: File system or I/O operation failed
 * - ConfigError: Configuration validation failed
 * - AnalysisError: A Stage 1 task failed for one file
 * - DuplicateSymbol: Two functions share a (file_path, function_name) key
 * - CacheCorrupted: A per-file cache entry failed verification
 * - Cancelled: A batch was cancelled before the barrier
 * - InternalError: Unexpected internal error
 *
 * Usage:
 * @code
 *     auto linked = linker.link(context);
 *     if (linked.is_err()) {
 *         std::cerr << linked.error() << std::endl;
 *         // Output: [DuplicateSymbol] Function defined twice (context: src/a.rs:main)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace cie {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Resource not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration error
        AnalysisError,    ///< Per-file analysis failed
        DuplicateSymbol,  ///< Duplicate registry key during linking
        CacheCorrupted,   ///< Cache entry failed verification
        Cancelled,        ///< Batch cancelled before publishing
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::DuplicateSymbol: return "DuplicateSymbol";
            case ErrorCode::CacheCorrupted:  return "CacheCorrupted";
            case ErrorCode::Cancelled:       return "Cancelled";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Snake-case spelling used in the JSON contract.
     */
    inline const char* error_code_to_key(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "none";
            case ErrorCode::InvalidArgument: return "invalid_argument";
            case ErrorCode::NotFound:        return "not_found";
            case ErrorCode::ParseError:      return "parse_error";
            case ErrorCode::IoError:         return "io_error";
            case ErrorCode::ConfigError:     return "config_error";
            case ErrorCode::AnalysisError:   return "analysis_error";
            case ErrorCode::DuplicateSymbol: return "duplicate_symbol";
            case ErrorCode::CacheCorrupted:  return "cache_corrupted";
            case ErrorCode::Cancelled:       return "cancelled";
            case ErrorCode::InternalError:   return "internal_error";
        }
        return "unknown";
    }

    /**
     * Structured error type with code, message, and optional context.
     *
     * Error objects are immutable after construction. The context names the
     * offending item (a file path, a registry key, a config field) so a
     * caller can surface it without parsing the message.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * Creates an error for a Stage 1 task that failed on one file.
         */
        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        /**
         * Creates a duplicate registry key error. The context is the key.
         */
        static Error duplicate_symbol(std::string message, std::string key) {
            return {ErrorCode::DuplicateSymbol, std::move(message), std::move(key)};
        }

        static Error cache_corrupted(std::string message, std::string key) {
            return {ErrorCode::CacheCorrupted, std::move(message), std::move(key)};
        }

        static Error cancelled(std::string message) {
            return {ErrorCode::Cancelled, std::move(message)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Creates a new error with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace cie

#endif //CIE_ERROR_HPP
