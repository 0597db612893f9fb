//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_SYMBOLS_SCAN_SUPPORT_HPP
#define CIE_SYMBOLS_SCAN_SUPPORT_HPP

#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cie::symbols::detail {

    /**
     * Keywords that begin statements rather than declarations.
     */
    bool is_control_keyword(std::string_view word);

    inline CodeLocation location_of(const lexer::TokenView& tokens, const std::size_t i, const std::string& file_path) {
        return CodeLocation{file_path, tokens[i].line, tokens[i].start_col};
    }

    /**
     * Line of the closing delimiter, or of the last token for an unclosed body.
     */
    inline std::size_t end_line_of(const lexer::TokenView& tokens, const std::size_t body_end) {
        return tokens.valid(body_end) ? tokens[body_end].line : tokens.last_line();
    }

    inline Diagnostic unclosed_body(const std::string& file_path, const Token& open, const std::string& name) {
        return Diagnostic{
            DiagnosticLevel::Warning,
            "syntax.unclosed-body",
            "Body of '" + name + "' is not closed; end of file used as its end",
            CodeLocation{file_path, open.line, open.start_col}
        };
    }

    /**
     * Names closures and lambdas after their opening location so they are
     * unique within a file.
     */
    inline std::string anonymous_name(const std::string_view kind, const Token& at) {
        return "{" + std::string(kind) + "}@" + std::to_string(at.line) + ":" + std::to_string(at.start_col);
    }

    /**
     * True when token i is a "#" opening a preprocessor line.
     */
    inline bool is_directive_start(const lexer::TokenView& tokens, const std::size_t i) {
        return tokens.is_operator(i, "#") && (i == 0 || tokens[i - 1].line < tokens[i].line);
    }

    /**
     * Index of the last token of the preprocessor line starting at i,
     * following backslash continuations.
     */
    std::size_t directive_end(const lexer::TokenView& tokens, std::size_t i);

    /**
     * Opening brace of a struct/union/class/enum body whose keyword is at
     * index keyword, or nothing for a forward declaration, a variable of a
     * tagged type, or a function returning one.
     */
    std::optional<std::size_t> aggregate_body(const lexer::TokenView& tokens, std::size_t keyword);

    /**
     * Scope of a declaration at token index: global outside any function,
     * function directly inside a body, block when nested deeper.
     */
    VariableScope scope_at(const lexer::TokenView& tokens,
                           const std::vector<FunctionInfo>& functions,
                           std::size_t index,
                           std::optional<std::size_t>& function_index);

    /**
     * Identifiers bound by a Rust pattern in [begin, end): lowercase names
     * not used as paths, calls or struct names.
     */
    std::vector<std::size_t> rust_pattern_bindings(const lexer::TokenView& tokens,
                                                   std::size_t begin,
                                                   std::size_t end);

    /**
     * First index in [begin, end) holding operator op at bracket depth 0,
     * or end.
     */
    std::size_t find_top_level(const lexer::TokenView& tokens,
                               std::size_t begin,
                               std::size_t end,
                               std::string_view op);

    /**
     * Builds a parameter variable from a C-family parameter declaration in
     * [begin, end). Returns nothing for unnamed parameters, "void" and "...".
     */
    std::optional<VariableInfo> c_parameter(const lexer::TokenView& tokens,
                                            std::size_t begin,
                                            std::size_t end,
                                            const std::string& file_path);

    /**
     * Builds parameter variables from a Rust parameter or closure argument
     * in [begin, end). "self" receivers produce nothing.
     */
    std::vector<VariableInfo> rust_parameters(const lexer::TokenView& tokens,
                                              std::size_t begin,
                                              std::size_t end,
                                              const std::string& file_path);

}  // namespace cie::symbols::detail

#endif //CIE_SYMBOLS_SCAN_SUPPORT_HPP
