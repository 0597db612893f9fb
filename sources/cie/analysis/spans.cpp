//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/spans.hpp"

#include <algorithm>

namespace cie::analysis {

    Owners function_owners(const std::vector<FunctionInfo>& functions, const std::size_t token_count) {
        Owners owners(token_count);
        // Nested bodies come later in position order and overwrite their parent.
        for (std::size_t f = 0; f < functions.size(); ++f) {
            const auto& function = functions[f];
            const std::size_t end = std::min(function.body_end, token_count);
            for (std::size_t i = function.body_begin; i < end; ++i) {
                owners[i] = f;
            }
        }
        return owners;
    }

    bool is_loop_keyword(const Token& token, const Language language) noexcept {
        if (token.type != TokenType::Keyword || language == Language::Assembly) {
            return false;
        }
        if (language == Language::Rust) {
            return token.value == "for" || token.value == "while" || token.value == "loop";
        }
        return token.value == "for" || token.value == "while" || token.value == "do";
    }

    std::optional<std::pair<std::size_t, std::size_t>> loop_body(const lexer::TokenView& tokens,
                                                                  const std::size_t keyword,
                                                                  const Language language) {
        if (!tokens.valid(keyword) || !is_loop_keyword(tokens[keyword], language)) {
            return std::nullopt;
        }
        const Token& token = tokens[keyword];

        if (language == Language::Rust) {
            bool saw_in = token.value != "for";
            for (std::size_t i = keyword + 1; tokens.valid(i); ++i) {
                if (tokens.is_operator(i, "{")) {
                    if (!saw_in) {
                        return std::nullopt;
                    }
                    return std::make_pair(i, tokens.matching_or_end(i) + 1);
                }
                if (tokens.is_operator(i, ";") || tokens.is_operator(i, "}")) {
                    return std::nullopt;
                }
                if (tokens.is_keyword(i, "in")) {
                    saw_in = true;
                } else if (tokens.is_operator(i, "(") || tokens.is_operator(i, "[")) {
                    i = tokens.matching_or_end(i);
                }
            }
            return std::nullopt;
        }

        std::size_t start = keyword + 1;
        if (token.value != "do") {
            if (!tokens.is_operator(start, "(")) {
                return std::nullopt;
            }
            start = tokens.matching_or_end(start) + 1;
        }
        if (!tokens.valid(start)) {
            return std::nullopt;
        }
        if (tokens.is_operator(start, "{")) {
            return std::make_pair(start, tokens.matching_or_end(start) + 1);
        }
        if (tokens.is_operator(start, ";")) {
            return std::nullopt;  // "while (x);" or the tail of do-while
        }
        // Single statement body.
        std::size_t end = start;
        while (tokens.valid(end) && !tokens.is_operator(end, ";")) {
            if (tokens.is_operator(end, "(") || tokens.is_operator(end, "[") || tokens.is_operator(end, "{")) {
                end = tokens.matching_or_end(end);
            }
            ++end;
        }
        return std::make_pair(start, std::min(end + 1, tokens.size()));
    }

    std::vector<int> loop_depths(const lexer::TokenView& tokens, const Language language) {
        std::vector<int> depths(tokens.size(), 0);
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (const auto body = loop_body(tokens, i, language)) {
                for (std::size_t j = body->first; j < body->second && j < depths.size(); ++j) {
                    ++depths[j];
                }
            }
        }
        return depths;
    }

}  // namespace cie::analysis
