//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_COMPLEXITY_HPP
#define CIE_ANALYSIS_COMPLEXITY_HPP

/**
 * @file complexity.hpp
 * @brief Cyclomatic-style complexity approximation.
 *
 * Each function starts at 1 and gains one unit per branching construct in
 * its own body: if, while, for, loop, case, catch, match arms ("=>"), the
 * "?" operator and every return that is not the final statement. Assembly
 * labels gain one unit per conditional branch. Constructs inside a nested
 * function or closure count for that function only.
 */

#include "cie/analysis/spans.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <vector>

namespace cie::analysis {

    /**
     * Complexity per function, index-aligned with functions.
     */
    std::vector<int> compute_complexity(const lexer::TokenView& tokens,
                                        const std::vector<FunctionInfo>& functions,
                                        const Owners& owners,
                                        Language language);

    /**
     * True when the token at index i is a branching construct.
     */
    [[nodiscard]] bool is_branch_construct(const lexer::TokenView& tokens, std::size_t i, Language language);

}  // namespace cie::analysis

#endif //CIE_ANALYSIS_COMPLEXITY_HPP
