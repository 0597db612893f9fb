//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_ANNOTATIONS_HPP
#define CIE_ANALYSIS_ANNOTATIONS_HPP

/**
 * @file annotations.hpp
 * @brief Learner-facing notes tied to recognized constructs.
 *
 * Inline explanations mark teaching moments (system calls, memory
 * management, interrupts, context switches, locking, unsafe code), at most
 * one per line and category. Educational comments cover broader patterns
 * and unused variables. Code suggestions flag risky or slow idioms.
 */

#include "cie/heuristics/config.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <optional>
#include <vector>

namespace cie::analysis {

    /**
     * Category of the teaching moment at token i, if any.
     */
    std::optional<ExplanationCategory> explanation_category(const lexer::TokenView& tokens,
                                                            std::size_t i,
                                                            Language language,
                                                            const heuristics::CallConfig& calls);

    std::vector<InlineExplanation> inline_explanations(const lexer::TokenView& tokens,
                                                       Language language,
                                                       const heuristics::CallConfig& calls);

    std::vector<EducationalComment> educational_comments(const lexer::TokenView& tokens,
                                                         Language language,
                                                         const std::vector<FunctionInfo>& functions,
                                                         const std::vector<VariableInfo>& variables,
                                                         const std::vector<VariableTrace>& traces);

    /**
     * Indices of non-global variables never read in their function or in
     * the closures nested in it. Names starting with "_" are intentionally
     * unused and skipped.
     */
    std::vector<std::size_t> unused_variables(const std::vector<FunctionInfo>& functions,
                                              const std::vector<VariableInfo>& variables,
                                              const std::vector<VariableTrace>& traces);

    std::vector<CodeSuggestion> code_suggestions(const lexer::TokenView& tokens,
                                                 Language language,
                                                 const std::vector<FunctionInfo>& functions,
                                                 const std::vector<int>& loop_depths,
                                                 const heuristics::ComplexityConfig& complexity);

}  // namespace cie::analysis

#endif //CIE_ANALYSIS_ANNOTATIONS_HPP
