//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_RESPONSE_HPP
#define CIE_RESPONSE_HPP

/**
 * @file response.hpp
 * @brief Query response envelope.
 *
 * The status tells a consumer why a payload looks the way it does:
 * - ok:     analysed, with at least one function
 * - empty:  analysed successfully, nothing to report
 * - failed: the file's Stage 1 task threw; payload is empty, error set
 * - stale:  the latest link run failed; payload is the last-known-good
 *           result and error names the offending key
 */

#include "cie/error.hpp"
#include "cie/types.hpp"

#include <optional>
#include <vector>

namespace cie::engine {

    enum class ResponseStatus {
        Ok,
        Empty,
        Failed,
        Stale
    };

    inline const char* to_string(ResponseStatus status) noexcept {
        switch (status) {
            case ResponseStatus::Ok:     return "ok";
            case ResponseStatus::Empty:  return "empty";
            case ResponseStatus::Failed: return "failed";
            case ResponseStatus::Stale:  return "stale";
        }
        return "failed";
    }

    template<typename T>
    struct Response {
        ResponseStatus status = ResponseStatus::Ok;
        T data{};
        std::vector<Diagnostic> diagnostics;
        std::optional<Error> error;
    };

    /**
     * A file whose Stage 1 task failed during a batch.
     */
    struct FailedFile {
        std::string file_path;
        Error error;
    };

    /**
     * Summary of one refresh() run.
     */
    struct BatchReport {
        std::size_t analyzed = 0;
        std::size_t reused = 0;
        std::vector<FailedFile> failed;
        std::optional<Error> link_error;
    };

}  // namespace cie::engine

#endif //CIE_RESPONSE_HPP
