//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_TOKEN_VIEW_HPP
#define CIE_TOKEN_VIEW_HPP

/**
 * @file token_view.hpp
 * @brief Comment-free, bracket-matched view over a token stream.
 *
 * Every structural scan (symbols, complexity, call sites, hotspots) works
 * on significant tokens only, so comments between a name and its
 * parenthesis never break a pattern. Indices handed out by this view are
 * the indices stored in FunctionInfo body ranges.
 */

#include "cie/types.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace cie::lexer {

    class TokenView {
    public:
        static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

        /**
         * @param tokens Full token stream, comments included. Must outlive the view.
         * @param source Original text; when given, text() slices it instead of
         *               joining token values.
         */
        explicit TokenView(const std::vector<Token>& tokens, std::string_view source = {});

        [[nodiscard]] std::size_t size() const noexcept {
            return indices_.size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return indices_.empty();
        }

        [[nodiscard]] const Token& operator[](const std::size_t i) const {
            return (*tokens_)[indices_[i]];
        }

        [[nodiscard]] bool valid(const std::size_t i) const noexcept {
            return i < indices_.size();
        }

        [[nodiscard]] bool is_operator(std::size_t i, std::string_view op) const noexcept;
        [[nodiscard]] bool is_keyword(std::size_t i, std::string_view word) const noexcept;
        [[nodiscard]] bool is_identifier(std::size_t i) const noexcept;

        /**
         * Index of the delimiter closing the one at open ("(", "[" or "{"),
         * or npos when the file ends first.
         */
        [[nodiscard]] std::size_t matching(std::size_t open) const noexcept;

        /**
         * Like matching(), but an unclosed delimiter closes at size().
         */
        [[nodiscard]] std::size_t matching_or_end(std::size_t open) const noexcept;

        /**
         * Skips a balanced "<...>" generic argument list starting at open.
         * Returns the index after the closing ">", or open when the list is
         * not balanced before a statement boundary.
         */
        [[nodiscard]] std::size_t skip_angle_brackets(std::size_t open) const noexcept;

        /**
         * Number of braces open before token i.
         */
        [[nodiscard]] std::size_t brace_depth(std::size_t i) const noexcept {
            return i < brace_depth_.size() ? brace_depth_[i] : 0;
        }

        /**
         * Source text of tokens [begin, end) with whitespace runs collapsed.
         */
        [[nodiscard]] std::string text(std::size_t begin, std::size_t end) const;

        /**
         * Line of the last significant token, 0 for an empty view.
         */
        [[nodiscard]] std::size_t last_line() const noexcept;

    private:
        const std::vector<Token>* tokens_;
        std::string_view source_;
        std::vector<std::size_t> indices_;
        std::vector<std::size_t> match_;
        std::vector<std::size_t> brace_depth_;
    };

}  // namespace cie::lexer

#endif //CIE_TOKEN_VIEW_HPP
