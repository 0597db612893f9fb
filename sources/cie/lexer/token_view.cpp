//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/lexer/token_view.hpp"

#include <cctype>

namespace cie::lexer {

    namespace {
        int bracket_kind(const Token& token) noexcept {
            if (token.type != TokenType::Operator || token.value.size() != 1) {
                return -1;
            }
            switch (token.value[0]) {
                case '(': case ')': return 0;
                case '[': case ']': return 1;
                case '{': case '}': return 2;
                default: return -1;
            }
        }

        bool is_opening(const Token& token) noexcept {
            return token.value == "(" || token.value == "[" || token.value == "{";
        }
    }

    TokenView::TokenView(const std::vector<Token>& tokens, const std::string_view source)
        : tokens_(&tokens)
        , source_(source) {
        indices_.reserve(tokens.size());
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (!tokens[i].is_trivia()) {
                indices_.push_back(i);
            }
        }

        match_.assign(indices_.size(), npos);
        brace_depth_.assign(indices_.size(), 0);

        // One stack per bracket kind, so a stray ")" cannot unbalance braces.
        std::vector<std::size_t> stacks[3];
        std::size_t depth = 0;
        for (std::size_t i = 0; i < indices_.size(); ++i) {
            const Token& token = (*this)[i];
            brace_depth_[i] = depth;
            const int kind = bracket_kind(token);
            if (kind < 0) {
                continue;
            }
            auto& stack = stacks[kind];
            if (is_opening(token)) {
                stack.push_back(i);
                if (kind == 2) {
                    ++depth;
                }
            } else if (!stack.empty()) {
                match_[stack.back()] = i;
                match_[i] = stack.back();
                stack.pop_back();
                if (kind == 2) {
                    --depth;
                    brace_depth_[i] = depth;
                }
            }
        }
    }

    bool TokenView::is_operator(const std::size_t i, const std::string_view op) const noexcept {
        return valid(i) && (*this)[i].is_operator(op);
    }

    bool TokenView::is_keyword(const std::size_t i, const std::string_view word) const noexcept {
        return valid(i) && (*this)[i].is_keyword(word);
    }

    bool TokenView::is_identifier(const std::size_t i) const noexcept {
        return valid(i) && (*this)[i].type == TokenType::Identifier;
    }

    std::size_t TokenView::matching(const std::size_t open) const noexcept {
        return open < match_.size() ? match_[open] : npos;
    }

    std::size_t TokenView::matching_or_end(const std::size_t open) const noexcept {
        const std::size_t close = matching(open);
        return close == npos ? size() : close;
    }

    std::size_t TokenView::skip_angle_brackets(const std::size_t open) const noexcept {
        if (!is_operator(open, "<")) {
            return open;
        }
        int depth = 0;
        for (std::size_t i = open; i < size(); ++i) {
            const Token& token = (*this)[i];
            if (token.type != TokenType::Operator) {
                continue;
            }
            if (token.value == "<") {
                ++depth;
            } else if (token.value == ">") {
                --depth;
            } else if (token.value == ">>") {
                depth -= 2;
            } else if (token.value == "(" || token.value == "[") {
                const std::size_t close = matching(i);
                if (close == npos) {
                    return open;
                }
                i = close;
                continue;
            } else if (token.value == ";" || token.value == "{" || token.value == "}") {
                return open;
            }
            if (depth <= 0) {
                return i + 1;
            }
        }
        return open;
    }

    std::string TokenView::text(const std::size_t begin, std::size_t end) const {
        if (end > size()) {
            end = size();
        }
        if (begin >= end) {
            return {};
        }

        if (!source_.empty()) {
            const Token& first = (*this)[begin];
            const Token& last = (*this)[end - 1];
            const std::string_view raw = source_.substr(first.offset, last.offset + last.length - first.offset);

            std::string collapsed;
            collapsed.reserve(raw.size());
            bool in_space = false;
            for (const char c : raw) {
                if (std::isspace(static_cast<unsigned char>(c))) {
                    in_space = true;
                    continue;
                }
                if (in_space && !collapsed.empty()) {
                    collapsed.push_back(' ');
                }
                in_space = false;
                collapsed.push_back(c);
            }
            return collapsed;
        }

        std::string joined;
        for (std::size_t i = begin; i < end; ++i) {
            if (i > begin) {
                joined.push_back(' ');
            }
            joined += (*this)[i].value;
        }
        return joined;
    }

    std::size_t TokenView::last_line() const noexcept {
        return empty() ? 0 : (*this)[size() - 1].end_line;
    }

}  // namespace cie::lexer
