//
// Created by gregorian-rayne on 10/18/26.
//

#include "scan_support.hpp"
#include "cie/symbols/symbol_extractor.hpp"

#include <cctype>
#include <unordered_set>

namespace cie::symbols::detail {

    bool is_control_keyword(const std::string_view word) {
        static const std::unordered_set<std::string_view> words = {
            "return", "if", "else", "while", "for", "do", "switch", "case", "default",
            "goto", "break", "continue", "sizeof", "new", "delete", "throw", "co_return",
            "co_await", "co_yield", "typedef", "using", "namespace", "template",
            "public", "private", "protected", "match", "loop", "let", "in", "as",
            "await", "yield"
        };
        return words.contains(word);
    }

    std::size_t directive_end(const lexer::TokenView& tokens, std::size_t i) {
        std::size_t line = tokens[i].line;
        while (tokens.valid(i + 1)) {
            const Token& next = tokens[i + 1];
            if (tokens[i].value == "\\") {
                line = next.line;
            } else if (next.line != line) {
                break;
            }
            ++i;
        }
        return i;
    }

    std::optional<std::size_t> aggregate_body(const lexer::TokenView& tokens, const std::size_t keyword) {
        for (std::size_t j = keyword + 1; tokens.valid(j); ++j) {
            const Token& token = tokens[j];
            if (token.is_operator("{")) {
                return j;
            }
            if (token.is_operator(";") || token.is_operator("(") || token.is_operator("=") ||
                token.is_operator(")") || token.is_operator(",") || token.is_operator("*") ||
                token.is_operator(">") || token.is_operator(">>")) {
                return std::nullopt;  // ">" closes a template parameter list: template <class T>
            }
            if (token.is_operator("<")) {
                const std::size_t after = tokens.skip_angle_brackets(j);
                if (after == j) {
                    return std::nullopt;
                }
                j = after - 1;
            }
        }
        return std::nullopt;
    }

    VariableScope scope_at(const lexer::TokenView& tokens,
                           const std::vector<FunctionInfo>& functions,
                           const std::size_t index,
                           std::optional<std::size_t>& function_index) {
        function_index = enclosing_function(functions, index);
        if (!function_index) {
            return VariableScope::Global;
        }

        const auto& function = functions[*function_index];
        if (!tokens.is_operator(function.body_begin, "{")) {
            return VariableScope::Function;
        }
        const std::size_t body_depth = tokens.brace_depth(function.body_begin) + 1;
        return tokens.brace_depth(index) > body_depth ? VariableScope::Block : VariableScope::Function;
    }

    std::vector<std::size_t> rust_pattern_bindings(const lexer::TokenView& tokens,
                                                   const std::size_t begin,
                                                   const std::size_t end) {
        std::vector<std::size_t> bindings;
        for (std::size_t i = begin; i < end; ++i) {
            if (!tokens.is_identifier(i)) {
                continue;
            }
            const std::string& name = tokens[i].value;
            if (name.empty() || name.front() == '\'' || std::isupper(static_cast<unsigned char>(name.front()))) {
                continue;
            }
            if (tokens.is_operator(i + 1, "(") || tokens.is_operator(i + 1, "{") ||
                tokens.is_operator(i + 1, "::") || tokens.is_operator(i + 1, "!")) {
                continue;
            }
            if (i > begin && (tokens.is_operator(i - 1, "::") || tokens.is_operator(i - 1, "."))) {
                continue;
            }
            // In "Point { x: px, .. }" the field name before ':' is not a binding.
            if (tokens.is_operator(i + 1, ":") && i > begin &&
                (tokens.is_operator(i - 1, "{") || tokens.is_operator(i - 1, ","))) {
                bool inside_struct_pattern = false;
                for (std::size_t j = i; j-- > begin;) {
                    if (tokens.is_operator(j, "{")) {
                        inside_struct_pattern = true;
                        break;
                    }
                    if (tokens.is_operator(j, "(") || tokens.is_operator(j, "}")) {
                        break;
                    }
                }
                if (inside_struct_pattern) {
                    continue;
                }
            }
            bindings.push_back(i);
        }
        return bindings;
    }

    std::size_t find_top_level(const lexer::TokenView& tokens,
                               const std::size_t begin,
                               const std::size_t end,
                               const std::string_view op) {
        int angle = 0;
        for (std::size_t i = begin; i < end; ++i) {
            const Token& token = tokens[i];
            if (token.type != TokenType::Operator) {
                continue;
            }
            if (token.value == op && angle == 0) {
                return i;
            }
            if (token.value == "(" || token.value == "[" || token.value == "{") {
                const std::size_t match = tokens.matching(i);
                if (match == lexer::TokenView::npos || match >= end) {
                    return end;
                }
                i = match;
            } else if (token.value == "<" && op != "<") {
                ++angle;
            } else if (token.value == ">" && angle > 0) {
                --angle;
            } else if (token.value == ">>" && angle > 0) {
                angle = angle > 1 ? angle - 2 : 0;
            }
        }
        return end;
    }

    std::optional<VariableInfo> c_parameter(const lexer::TokenView& tokens,
                                            const std::size_t begin,
                                            std::size_t end,
                                            const std::string& file_path) {
        const std::size_t default_arg = find_top_level(tokens, begin, end, "=");
        const std::optional<std::string> initial = default_arg < end
            ? std::optional<std::string>(tokens.text(default_arg + 1, end))
            : std::nullopt;
        end = default_arg;

        std::optional<std::size_t> name_index;
        std::size_t meaningful = 0;
        bool is_const = false;
        for (std::size_t i = begin; i < end; ++i) {
            const Token& token = tokens[i];
            if (token.is_operator("[")) {
                break;
            }
            if (token.is_keyword("const")) {
                is_const = true;
            }
            const bool is_tag = i > begin &&
                (tokens.is_keyword(i - 1, "struct") || tokens.is_keyword(i - 1, "union") ||
                 tokens.is_keyword(i - 1, "enum") || tokens.is_keyword(i - 1, "class"));
            if (token.type == TokenType::Identifier && !is_tag) {
                name_index = i;
            }
            if (token.type == TokenType::Identifier || token.type == TokenType::Keyword) {
                ++meaningful;
            }
        }

        if (!name_index || meaningful < 2) {
            return std::nullopt;
        }

        VariableInfo variable;
        variable.name = tokens[*name_index].value;
        variable.var_type = tokens.text(begin, *name_index);
        if (variable.var_type.empty()) {
            variable.var_type = "unknown";
        }
        variable.line = tokens[*name_index].line;
        variable.scope = VariableScope::Function;
        variable.is_mutable = !is_const;
        variable.initialized_value = initial;
        variable.location = location_of(tokens, *name_index, file_path);
        variable.token_index = *name_index;
        return variable;
    }

    std::vector<VariableInfo> rust_parameters(const lexer::TokenView& tokens,
                                              const std::size_t begin,
                                              const std::size_t end,
                                              const std::string& file_path) {
        std::vector<VariableInfo> parameters;

        const std::size_t colon = find_top_level(tokens, begin, end, ":");
        const std::string type = colon < end ? tokens.text(colon + 1, end) : "inferred";

        bool is_mutable = false;
        for (std::size_t i = begin; i < colon; ++i) {
            if (tokens.is_keyword(i, "self")) {
                return parameters;
            }
            if (tokens.is_keyword(i, "mut")) {
                is_mutable = true;
            }
        }

        const auto bindings = rust_pattern_bindings(tokens, begin, colon);
        for (const std::size_t index : bindings) {
            VariableInfo variable;
            variable.name = tokens[index].value;
            variable.var_type = bindings.size() == 1 ? type : "inferred";
            variable.line = tokens[index].line;
            variable.scope = VariableScope::Function;
            variable.is_mutable = is_mutable;
            variable.location = location_of(tokens, index, file_path);
            variable.token_index = index;
            parameters.push_back(std::move(variable));
        }
        return parameters;
    }

}  // namespace cie::symbols::detail
