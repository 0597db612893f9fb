//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_INTRA_FILE_ANALYZER_HPP
#define CIE_INTRA_FILE_ANALYZER_HPP

/**
 * @file intra_file_analyzer.hpp
 * @brief Per-file analysis over extracted symbols.
 *
 * Runs inside a Stage 1 task: assigns complexity and educational
 * descriptions to the extracted functions, then builds the data-flow
 * traces and the learner annotations for the file. Reads configuration
 * only.
 */

#include "cie/analysis/spans.hpp"
#include "cie/heuristics/config.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <vector>

namespace cie::analysis {

    struct IntraFileResult {
        std::vector<VariableTrace> data_flow;
        std::vector<InlineExplanation> inline_explanations;
        std::vector<EducationalComment> educational_comments;
        std::vector<CodeSuggestion> suggestions;
        int complexity_score = 0;
    };

    class IntraFileAnalyzer {
    public:
        IntraFileAnalyzer(Language language, const heuristics::HeuristicsConfig& config);

        /**
         * Analyzes one file.
         *
         * @param tokens     Significant tokens of the file.
         * @param functions  Extracted functions; complexity and
         *                   educational_description are filled in place.
         * @param variables  Extracted variables and parameters.
         * @param owners     Innermost function per token.
         */
        [[nodiscard]] IntraFileResult analyze(const lexer::TokenView& tokens,
                                              std::vector<FunctionInfo>& functions,
                                              const std::vector<VariableInfo>& variables,
                                              const Owners& owners) const;

    private:
        Language language_;
        const heuristics::HeuristicsConfig& config_;
    };

}  // namespace cie::analysis

#endif //CIE_INTRA_FILE_ANALYZER_HPP
