//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_LEXER_HPP
#define CIE_LEXER_HPP

/**
 * @file lexer.hpp
 * @brief Converts raw source text into classified tokens.
 *
 * The lexer never fails. Every byte of the input is either whitespace or
 * part of exactly one token; bytes that fit no class become Unknown tokens
 * and unterminated strings or comments run to the end of their range. Each
 * recovery is reported as a Diagnostic next to the token stream.
 */

#include "cie/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cie::lexer {

    struct LexResult {
        std::vector<Token> tokens;
        std::vector<Diagnostic> diagnostics;
    };

    /**
     * Checks whether word is a reserved word of the dialect. For assembly
     * this covers instruction mnemonics (case-insensitive) and directives.
     */
    [[nodiscard]] bool is_keyword(Language language, std::string_view word);

    /**
     * Type names built into the dialect ("int", "u32", "usize", ...).
     * Used by the declaration scanner to recognize declarations.
     */
    [[nodiscard]] bool is_builtin_type(Language language, std::string_view word);

    /**
     * Tokenizes source with the rules of the given dialect. Unknown is lexed
     * with the C rules.
     *
     * @param source Raw source text.
     * @param language Dialect hint.
     * @param file_path Used only to anchor diagnostics.
     */
    [[nodiscard]] LexResult tokenize(std::string_view source,
                                     Language language,
                                     const std::string& file_path = {});

}  // namespace cie::lexer

#endif //CIE_LEXER_HPP
