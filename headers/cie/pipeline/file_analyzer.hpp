//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_FILE_ANALYZER_HPP
#define CIE_FILE_ANALYZER_HPP

/**
 * @file file_analyzer.hpp
 * @brief Stage 1: the per-file pipeline.
 *
 * lex -> extract symbols -> intra-file analysis -> call-site resolution.
 * A file is analyzed without looking at any other file, so many files can
 * run concurrently against the same read-only configuration.
 */

#include "cie/error.hpp"
#include "cie/heuristics/config.hpp"
#include "cie/types.hpp"

#include <string>

namespace cie::pipeline {

    /**
     * One (path, content) pair supplied by the change notifier.
     */
    struct SourceFile {
        std::string file_path;
        std::string content;
        /// Unknown derives the dialect from the file extension
        Language language = Language::Unknown;
    };

    class FileAnalyzer {
    public:
        explicit FileAnalyzer(const heuristics::HeuristicsConfig& config);

        /**
         * Runs Stage 1 on one file. Malformed input degrades to partial
         * facts plus diagnostics; only resource exhaustion or an internal
         * bug can throw.
         */
        [[nodiscard]] FileArtifacts analyze(const SourceFile& source) const;

    private:
        const heuristics::HeuristicsConfig& config_;
    };

    /**
     * Artifacts standing in for a file whose Stage 1 task threw. They
     * contribute nothing to linking.
     */
    [[nodiscard]] FileArtifacts failed_artifacts(const SourceFile& source,
                                                 std::string content_hash,
                                                 const Error& error);

    /**
     * Dialect used for a source: the explicit hint, else the extension.
     */
    [[nodiscard]] Language resolve_language(const SourceFile& source);

}  // namespace cie::pipeline

#endif //CIE_FILE_ANALYZER_HPP
