//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_SPANS_HPP
#define CIE_ANALYSIS_SPANS_HPP

/**
 * @file spans.hpp
 * @brief Per-token ownership and nesting facts shared by the analyzers.
 *
 * Complexity, call sites and hotspots all attribute a construct to the
 * innermost function whose body holds it, and several rules care whether
 * a token sits inside a loop. Both facts are computed once per file here.
 */

#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <optional>
#include <vector>

namespace cie::analysis {

    /**
     * Per-token innermost function.
     */
    using Owners = std::vector<std::optional<std::size_t>>;

    /**
     * Maps every token index to the innermost function whose body contains
     * it. Functions must be in position order.
     */
    Owners function_owners(const std::vector<FunctionInfo>& functions, std::size_t token_count);

    /**
     * Range [begin, end) of the body governed by the loop keyword at index
     * keyword, or nothing when the keyword does not start a loop
     * ("impl Trait for Type", a do-while tail).
     */
    std::optional<std::pair<std::size_t, std::size_t>> loop_body(const lexer::TokenView& tokens,
                                                                  std::size_t keyword,
                                                                  Language language);

    /**
     * Number of loop bodies enclosing each token.
     */
    std::vector<int> loop_depths(const lexer::TokenView& tokens, Language language);

    /**
     * True for for/while/loop/do keywords.
     */
    [[nodiscard]] bool is_loop_keyword(const Token& token, Language language) noexcept;

}  // namespace cie::analysis

#endif //CIE_ANALYSIS_SPANS_HPP
