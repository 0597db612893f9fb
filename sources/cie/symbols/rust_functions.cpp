//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"
#include "scan_support.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace cie::symbols::detail {

    namespace {
        /**
         * An impl, trait or inline mod block whose items get a name prefix.
         */
        struct NamedScope {
            std::size_t open = 0;
            std::size_t close = 0;
            std::string prefix;
        };

        /**
         * Last path segment with its generic arguments as written:
         * "fmt::Display" -> "Display", "From<io::Error>" -> "From<io::Error>".
         * Two impls of one generic trait or type stay distinct this way.
         */
        std::string last_segment(const lexer::TokenView& tokens, const std::size_t begin, const std::size_t end) {
            std::optional<std::size_t> segment;
            int angle = 0;
            for (std::size_t i = begin; i < end; ++i) {
                const Token& token = tokens[i];
                if (token.is_operator("<")) {
                    ++angle;
                } else if (token.is_operator(">")) {
                    angle = std::max(0, angle - 1);
                } else if (token.is_operator(">>")) {
                    angle = std::max(0, angle - 2);
                } else if (angle == 0 && token.type == TokenType::Identifier && token.value.front() != '\'') {
                    segment = i;
                }
            }
            if (!segment) {
                return {};
            }

            std::size_t segment_end = *segment + 1;
            if (segment_end < end && tokens.is_operator(segment_end, "<")) {
                segment_end = std::min(end, tokens.skip_angle_brackets(segment_end));
            }
            return tokens.text(*segment, std::max(segment_end, *segment + 1));
        }

        /**
         * First "{" or ";" at or after begin, skipping bracketed groups.
         */
        std::size_t find_block_or_semicolon(const lexer::TokenView& tokens, std::size_t begin) {
            for (std::size_t i = begin; i < tokens.size(); ++i) {
                if (tokens.is_operator(i, "{") || tokens.is_operator(i, ";")) {
                    return i;
                }
                if (tokens.is_operator(i, "(") || tokens.is_operator(i, "[")) {
                    i = tokens.matching_or_end(i);
                }
            }
            return tokens.size();
        }

        std::vector<NamedScope> collect_scopes(const lexer::TokenView& tokens) {
            std::vector<NamedScope> scopes;
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                if (tokens.is_keyword(i, "impl")) {
                    std::size_t header = tokens.skip_angle_brackets(i + 1);
                    const std::size_t brace = find_block_or_semicolon(tokens, header);
                    if (!tokens.is_operator(brace, "{")) {
                        continue;
                    }

                    std::size_t for_index = brace;
                    std::size_t where_index = brace;
                    for (std::size_t j = header; j < brace; ++j) {
                        if (tokens.is_keyword(j, "for") && for_index == brace) {
                            for_index = j;
                        } else if (tokens.is_keyword(j, "where")) {
                            where_index = j;
                            break;
                        }
                    }

                    NamedScope scope;
                    scope.open = brace;
                    scope.close = tokens.matching_or_end(brace);
                    if (for_index < brace) {
                        const std::string trait = last_segment(tokens, header, for_index);
                        const std::string type = last_segment(tokens, for_index + 1, where_index);
                        scope.prefix = "<" + type + " as " + trait + ">";
                    } else {
                        scope.prefix = last_segment(tokens, header, where_index);
                    }
                    if (!scope.prefix.empty()) {
                        scopes.push_back(std::move(scope));
                    }
                } else if ((tokens.is_keyword(i, "trait") || tokens.is_keyword(i, "mod")) &&
                           tokens.is_identifier(i + 1)) {
                    const std::size_t brace = find_block_or_semicolon(tokens, i + 2);
                    if (tokens.is_operator(brace, "{")) {
                        scopes.push_back(NamedScope{brace, tokens.matching_or_end(brace), tokens[i + 1].value});
                    }
                }
            }
            return scopes;
        }

        bool opens_closure(const lexer::TokenView& tokens, const std::size_t i) {
            if (i == 0) {
                return false;
            }
            static const std::unordered_set<std::string_view> preceding = {
                "(", ",", "=", "=>", "{", ";", ":", "[", "||", "&&"
            };
            const Token& prev = tokens[i - 1];
            if (prev.type == TokenType::Operator) {
                return preceding.contains(prev.value);
            }
            return prev.is_keyword("move") || prev.is_keyword("return");
        }

        class RustFunctionScanner {
        public:
            RustFunctionScanner(const lexer::TokenView& tokens, const std::string& file_path)
                : tokens_(tokens)
                , file_path_(file_path)
                , scopes_(collect_scopes(tokens)) {}

            FunctionScan run() {
                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    if (tokens_.is_keyword(i, "fn") && tokens_.is_identifier(i + 1)) {
                        scan_fn(i);
                    } else if ((tokens_.is_operator(i, "|") || tokens_.is_operator(i, "||")) &&
                               opens_closure(tokens_, i)) {
                        scan_closure(i);
                    }
                }
                return std::move(scan_);
            }

        private:
            void scan_fn(const std::size_t fn_index) {
                const std::size_t name_index = fn_index + 1;
                std::size_t paren = name_index + 1;
                if (tokens_.is_operator(paren, "<")) {
                    paren = tokens_.skip_angle_brackets(paren);
                }
                if (!tokens_.is_operator(paren, "(")) {
                    return;
                }
                const std::size_t paren_close = tokens_.matching(paren);
                if (paren_close == lexer::TokenView::npos) {
                    return;
                }

                std::size_t k = paren_close + 1;
                std::string return_type = "()";
                if (tokens_.is_operator(k, "->")) {
                    const std::size_t type_begin = k + 1;
                    std::size_t type_end = type_begin;
                    while (tokens_.valid(type_end) && !tokens_.is_operator(type_end, "{") &&
                           !tokens_.is_operator(type_end, ";") && !tokens_.is_keyword(type_end, "where")) {
                        if (tokens_.is_operator(type_end, "(") || tokens_.is_operator(type_end, "[")) {
                            type_end = tokens_.matching_or_end(type_end);
                        }
                        ++type_end;
                    }
                    return_type = tokens_.text(type_begin, type_end);
                    k = type_end;
                }
                if (tokens_.is_keyword(k, "where")) {
                    k = find_block_or_semicolon(tokens_, k);
                }
                if (!tokens_.is_operator(k, "{")) {
                    return;  // trait method or extern declaration without a body
                }

                std::size_t signature_begin = fn_index;
                while (signature_begin > 0) {
                    const Token& prev = tokens_[signature_begin - 1];
                    if (prev.is_keyword("pub") || prev.is_keyword("unsafe") || prev.is_keyword("async") ||
                        prev.is_keyword("const") || prev.is_keyword("extern") || prev.type == TokenType::String) {
                        --signature_begin;
                    } else if (prev.is_operator(")") && signature_begin >= 2) {
                        const std::size_t open = tokens_.matching(signature_begin - 1);
                        if (open == lexer::TokenView::npos || open == 0 || !tokens_.is_keyword(open - 1, "pub")) {
                            break;
                        }
                        signature_begin = open - 1;
                    } else {
                        break;
                    }
                }

                FunctionInfo function;
                function.name = qualified_name(signature_begin, tokens_[name_index].value);
                function.signature = tokens_.text(signature_begin, k);
                function.return_type = std::move(return_type);
                function.location = location_of(tokens_, name_index, file_path_);
                function.signature_begin = signature_begin;
                function.start_line = tokens_[signature_begin].line;

                for (const auto& [begin, end] : split_top_level(tokens_, paren, paren_close)) {
                    function.parameters.push_back(tokens_.text(begin, end));
                    add_parameters(begin, end);
                }

                finish_body(function, k);
            }

            void scan_closure(const std::size_t bar) {
                std::size_t params_close = bar;
                if (tokens_.is_operator(bar, "|")) {
                    params_close = lexer::TokenView::npos;
                    for (std::size_t j = bar + 1; tokens_.valid(j); ++j) {
                        if (tokens_.is_operator(j, "|")) {
                            params_close = j;
                            break;
                        }
                        if (tokens_.is_operator(j, "(") || tokens_.is_operator(j, "[")) {
                            j = tokens_.matching_or_end(j);
                            continue;
                        }
                        if (tokens_.is_operator(j, ";") || tokens_.is_operator(j, "{") || tokens_.is_operator(j, "}")) {
                            break;
                        }
                    }
                    if (params_close == lexer::TokenView::npos) {
                        return;
                    }
                }

                std::size_t k = params_close + 1;
                if (tokens_.is_operator(k, "->")) {
                    while (tokens_.valid(k) && !tokens_.is_operator(k, "{") && !tokens_.is_operator(k, ";")) {
                        ++k;
                    }
                }
                if (!tokens_.is_operator(k, "{")) {
                    return;
                }

                const std::size_t signature_begin = tokens_.is_keyword(bar - 1, "move") ? bar - 1 : bar;

                FunctionInfo function;
                function.name = anonymous_name("closure", tokens_[bar]);
                function.signature = tokens_.text(signature_begin, k);
                function.return_type = "inferred";
                function.location = location_of(tokens_, bar, file_path_);
                function.signature_begin = signature_begin;
                function.start_line = tokens_[signature_begin].line;
                function.is_closure = true;

                if (params_close > bar) {
                    for (const auto& [begin, end] : split_top_level(tokens_, bar, params_close)) {
                        function.parameters.push_back(tokens_.text(begin, end));
                        add_parameters(begin, end);
                    }
                }

                finish_body(function, k);
            }

            void add_parameters(const std::size_t begin, const std::size_t end) {
                for (auto& variable : rust_parameters(tokens_, begin, end, file_path_)) {
                    variable.function_index = scan_.functions.size();
                    scan_.parameters.push_back(std::move(variable));
                }
            }

            void finish_body(FunctionInfo& function, const std::size_t open) {
                function.body_begin = open;
                const std::size_t close = tokens_.matching(open);
                if (close == lexer::TokenView::npos) {
                    function.body_end = tokens_.size();
                    scan_.diagnostics.push_back(unclosed_body(file_path_, tokens_[open], function.name));
                } else {
                    function.body_end = close;
                }
                function.end_line = std::max(function.start_line, end_line_of(tokens_, close));
                scan_.functions.push_back(std::move(function));
            }

            /**
             * Prefixes the name with the impl/trait/mod blocks around it that
             * are not separated from it by an enclosing function body.
             */
            std::string qualified_name(const std::size_t position, const std::string& name) const {
                std::optional<std::size_t> enclosing_body;
                for (const auto& function : scan_.functions) {
                    if (function.contains_token(position) &&
                        (!enclosing_body || function.body_begin > *enclosing_body)) {
                        enclosing_body = function.body_begin;
                    }
                }

                std::string qualified;
                for (const auto& scope : scopes_) {
                    if (scope.open < position && position < scope.close &&
                        (!enclosing_body || scope.open > *enclosing_body)) {
                        qualified += scope.prefix + "::";
                    }
                }
                return qualified + name;
            }


            const lexer::TokenView& tokens_;
            const std::string& file_path_;
            std::vector<NamedScope> scopes_;
            FunctionScan scan_;
        };
    }

    FunctionScan scan_rust_functions(const lexer::TokenView& tokens, const std::string& file_path) {
        return RustFunctionScanner(tokens, file_path).run();
    }

}  // namespace cie::symbols::detail
