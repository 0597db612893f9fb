//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"
#include "scan_support.hpp"

#include <algorithm>
#include <unordered_set>

namespace cie::symbols::detail {

    namespace {
        VariableInfo make_variable(const lexer::TokenView& tokens,
                                   const std::vector<FunctionInfo>& functions,
                                   const std::size_t name_index,
                                   const std::string& file_path) {
            VariableInfo variable;
            variable.name = tokens[name_index].value;
            variable.line = tokens[name_index].line;
            variable.location = location_of(tokens, name_index, file_path);
            variable.token_index = name_index;
            variable.scope = scope_at(tokens, functions, name_index, variable.function_index);
            return variable;
        }

        // ------------------------------------------------------------------
        // Rust
        // ------------------------------------------------------------------

        void scan_rust_let(const lexer::TokenView& tokens,
                           const std::vector<FunctionInfo>& functions,
                           const std::size_t let,
                           const std::string& file_path,
                           std::vector<VariableInfo>& out) {
            const bool conditional = let > 0 && (tokens.is_keyword(let - 1, "if") || tokens.is_keyword(let - 1, "while"));
            const std::size_t limit = tokens.size();

            const std::size_t eq = find_top_level(tokens, let + 1, limit, "=");
            const std::size_t semicolon = find_top_level(tokens, let + 1, limit, ";");
            const std::size_t pattern_end = std::min(eq, semicolon);

            std::size_t colon = conditional ? pattern_end : find_top_level(tokens, let + 1, pattern_end, ":");
            const std::string type = colon < pattern_end ? tokens.text(colon + 1, pattern_end) : "inferred";
            colon = std::min(colon, pattern_end);

            std::optional<std::string> initial;
            if (eq < semicolon) {
                std::size_t init_end = semicolon;
                if (conditional) {
                    init_end = find_top_level(tokens, eq + 1, limit, "{");
                } else {
                    // let-else: "let Some(x) = opt else { ... };"
                    for (std::size_t j = eq + 1; j < semicolon; ++j) {
                        if (tokens.is_keyword(j, "else")) {
                            init_end = j;
                            break;
                        }
                        if (tokens.is_operator(j, "(") || tokens.is_operator(j, "[") || tokens.is_operator(j, "{")) {
                            j = std::min(tokens.matching_or_end(j), semicolon);
                        }
                    }
                }
                initial = tokens.text(eq + 1, init_end);
            }

            const auto bindings = rust_pattern_bindings(tokens, let + 1, colon);
            for (const std::size_t index : bindings) {
                if (tokens[index].value == "_") {
                    continue;
                }
                VariableInfo variable = make_variable(tokens, functions, index, file_path);
                variable.var_type = bindings.size() == 1 ? type : "inferred";
                variable.is_mutable = index > 0 && tokens.is_keyword(index - 1, "mut");
                variable.initialized_value = initial;
                if (conditional) {
                    variable.scope = VariableScope::Block;
                }
                out.push_back(std::move(variable));
            }
        }

        void scan_rust_item(const lexer::TokenView& tokens,
                            const std::vector<FunctionInfo>& functions,
                            const std::size_t keyword,
                            const std::string& file_path,
                            std::vector<VariableInfo>& out) {
            std::size_t name = keyword + 1;
            const bool is_mutable = tokens.is_keyword(name, "mut");
            if (is_mutable) {
                ++name;
            }
            if (!tokens.is_identifier(name) || !tokens.is_operator(name + 1, ":")) {
                return;  // const fn, *const T, &'static
            }

            const std::size_t semicolon = find_top_level(tokens, name + 1, tokens.size(), ";");
            const std::size_t eq = find_top_level(tokens, name + 2, semicolon, "=");

            VariableInfo variable = make_variable(tokens, functions, name, file_path);
            variable.var_type = tokens.text(name + 2, eq);
            variable.is_mutable = is_mutable;
            if (eq < semicolon) {
                variable.initialized_value = tokens.text(eq + 1, semicolon);
            }
            out.push_back(std::move(variable));
        }

        void scan_rust_for(const lexer::TokenView& tokens,
                           const std::vector<FunctionInfo>& functions,
                           const std::size_t for_index,
                           const std::string& file_path,
                           std::vector<VariableInfo>& out) {
            std::size_t in = for_index + 1;
            while (tokens.valid(in) && !tokens.is_keyword(in, "in")) {
                if (tokens.is_operator(in, "{") || tokens.is_operator(in, ";")) {
                    return;
                }
                ++in;
            }
            if (!tokens.valid(in)) {
                return;
            }
            const std::size_t body = find_top_level(tokens, in + 1, tokens.size(), "{");

            for (const std::size_t index : rust_pattern_bindings(tokens, for_index + 1, in)) {
                if (tokens[index].value == "_") {
                    continue;
                }
                VariableInfo variable = make_variable(tokens, functions, index, file_path);
                variable.var_type = "inferred";
                variable.scope = VariableScope::Block;
                variable.is_mutable = index > 0 && tokens.is_keyword(index - 1, "mut");
                variable.initialized_value = tokens.text(in + 1, body);
                out.push_back(std::move(variable));
            }
        }

        std::vector<VariableInfo> scan_rust_variables(const lexer::TokenView& tokens,
                                                      const std::vector<FunctionInfo>& functions,
                                                      const std::string& file_path) {
            std::vector<VariableInfo> out;
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                if (tokens.is_keyword(i, "let")) {
                    scan_rust_let(tokens, functions, i, file_path, out);
                } else if (tokens.is_keyword(i, "static") || tokens.is_keyword(i, "const")) {
                    if (i > 0 && (tokens.is_operator(i - 1, "*") || tokens.is_operator(i - 1, "&"))) {
                        continue;
                    }
                    scan_rust_item(tokens, functions, i, file_path, out);
                } else if (tokens.is_keyword(i, "for") && !tokens.is_operator(i + 1, "<")) {
                    scan_rust_for(tokens, functions, i, file_path, out);
                }
            }
            return out;
        }

        // ------------------------------------------------------------------
        // C and C++
        // ------------------------------------------------------------------

        bool is_storage_class(const std::string_view word) {
            static const std::unordered_set<std::string_view> words = {
                "static", "extern", "register", "thread_local", "_Thread_local", "inline", "mutable"
            };
            return words.contains(word);
        }

        bool is_declaration_follower(const lexer::TokenView& tokens, const std::size_t i, const bool in_for) {
            if (!tokens.valid(i)) {
                return false;
            }
            const Token& token = tokens[i];
            return token.is_operator("=") || token.is_operator(";") || token.is_operator(",") ||
                   token.is_operator("[") || (in_for && token.is_operator(":")) || token.is_operator("{");
        }

        class CDeclarationScanner {
        public:
            CDeclarationScanner(const lexer::TokenView& tokens,
                                const Language language,
                                const std::vector<FunctionInfo>& functions,
                                const std::string& file_path)
                : tokens_(tokens)
                , cpp_(language == Language::Cpp)
                , functions_(functions)
                , file_path_(file_path) {}

            std::vector<VariableInfo> run() {
                // true for braces that open aggregate bodies, whose members are not variables
                std::vector<bool> braces;
                std::size_t pending_aggregate = lexer::TokenView::npos;
                bool statement_start = true;
                bool for_init = false;

                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    if (is_directive_start(tokens_, i)) {
                        i = directive_end(tokens_, i);
                        statement_start = true;
                        continue;
                    }

                    const Token& token = tokens_[i];
                    if (statement_start && (braces.empty() || !braces.back())) {
                        scan_declaration(i, for_init);
                    }
                    statement_start = false;
                    for_init = false;

                    if (token.is_keyword("struct") || token.is_keyword("union") || token.is_keyword("class") ||
                        token.is_keyword("enum")) {
                        if (const auto body = aggregate_body(tokens_, i)) {
                            pending_aggregate = *body;
                        }
                    }

                    if (token.is_operator("{")) {
                        braces.push_back(i == pending_aggregate);
                        statement_start = true;
                    } else if (token.is_operator("}")) {
                        if (!braces.empty()) {
                            braces.pop_back();
                        }
                        statement_start = true;
                    } else if (token.is_operator(";")) {
                        statement_start = true;
                    } else if (token.is_operator("(") && i > 0 && tokens_.is_keyword(i - 1, "for")) {
                        statement_start = true;
                        for_init = true;
                    } else if (token.is_operator(":") && i > 0 &&
                               (tokens_.is_keyword(i - 1, "public") || tokens_.is_keyword(i - 1, "private") ||
                                tokens_.is_keyword(i - 1, "protected"))) {
                        statement_start = true;
                    }
                }
                return std::move(out_);
            }

        private:
            /**
             * Parses "specifiers type declarator [= init] {, declarator};"
             * starting at s. Anything that is not a declaration is left alone.
             */
            void scan_declaration(const std::size_t s, const bool in_for) {
                const Token& first = tokens_[s];
                if (first.type == TokenType::Keyword && is_control_keyword(first.value)) {
                    return;
                }
                if (first.type != TokenType::Keyword && first.type != TokenType::Identifier) {
                    return;
                }

                std::size_t type_begin = s;
                while (tokens_.valid(type_begin) && tokens_[type_begin].type == TokenType::Keyword &&
                       is_storage_class(tokens_[type_begin].value)) {
                    ++type_begin;
                }

                // Type chain up to the first declarator's name.
                std::optional<std::size_t> name;
                std::size_t base_end = lexer::TokenView::npos;
                bool is_const = false;
                std::size_t words = 0;
                std::size_t j = type_begin;
                while (tokens_.valid(j)) {
                    const Token& token = tokens_[j];
                    if (token.type == TokenType::Keyword) {
                        if (is_control_keyword(token.value) || token.value == "operator") {
                            return;
                        }
                        if (token.value == "const" || token.value == "constexpr") {
                            is_const = true;
                        }
                        ++words;
                        ++j;
                        continue;
                    }
                    if (token.type == TokenType::Identifier) {
                        if (is_declaration_follower(tokens_, j + 1, in_for) && words > 0) {
                            name = j;
                            break;
                        }
                        ++words;
                        ++j;
                        continue;
                    }
                    if (token.is_operator("::")) {
                        ++j;
                        continue;
                    }
                    if (token.is_operator("*") || token.is_operator("&") || token.is_operator("&&")) {
                        if (base_end == lexer::TokenView::npos) {
                            base_end = j;
                        }
                        ++j;
                        continue;
                    }
                    if (token.is_operator("<") && cpp_) {
                        const std::size_t after = tokens_.skip_angle_brackets(j);
                        if (after == j) {
                            return;
                        }
                        j = after;
                        continue;
                    }
                    if (token.is_operator("{") && j > type_begin) {
                        // struct { ... } name;
                        const bool tagged = tokens_.is_keyword(type_begin, "struct") ||
                                            tokens_.is_keyword(type_begin, "union") ||
                                            tokens_.is_keyword(type_begin, "enum");
                        if (!tagged) {
                            return;
                        }
                        j = tokens_.matching_or_end(j) + 1;
                        continue;
                    }
                    return;
                }
                if (!name) {
                    return;
                }
                const Token& before = tokens_[*name - 1];
                if (before.is_keyword("struct") || before.is_keyword("union") || before.is_keyword("enum") ||
                    before.is_keyword("class")) {
                    return;  // tag of a type definition, not a declarator
                }
                if (tokens_.is_operator(*name + 1, "{") && (!cpp_ || !enclosing_function(functions_, s))) {
                    return;
                }

                const std::string base_type = tokens_.text(type_begin, std::min(base_end, *name));
                std::size_t declarator_begin = base_end == lexer::TokenView::npos ? *name : base_end;

                while (name) {
                    record(*name, base_type, declarator_begin, is_const, in_for);

                    std::size_t k = *name + 1;
                    if (tokens_.is_operator(k, "[")) {
                        k = tokens_.matching_or_end(k) + 1;
                    }
                    if (tokens_.is_operator(k, "=")) {
                        const std::size_t init_end = initializer_end(k + 1, in_for);
                        out_.back().initialized_value = tokens_.text(k + 1, init_end);
                        k = init_end;
                    } else if (tokens_.is_operator(k, "{")) {
                        const std::size_t close = tokens_.matching_or_end(k);
                        out_.back().initialized_value = tokens_.text(k, close + 1);
                        k = close + 1;
                    } else if (in_for && tokens_.is_operator(k, ":")) {
                        out_.back().initialized_value = tokens_.text(k + 1, tokens_.matching_or_end(s - 1));
                        return;
                    }

                    if (!tokens_.is_operator(k, ",")) {
                        return;
                    }

                    // Next declarator: pointer marks then a name.
                    declarator_begin = k + 1;
                    std::size_t next = k + 1;
                    while (tokens_.is_operator(next, "*") || tokens_.is_operator(next, "&")) {
                        ++next;
                    }
                    name = tokens_.is_identifier(next) && is_declaration_follower(tokens_, next + 1, in_for)
                        ? std::optional<std::size_t>(next)
                        : std::nullopt;
                }
            }

            std::size_t initializer_end(std::size_t k, const bool in_for) const {
                for (; tokens_.valid(k); ++k) {
                    const Token& token = tokens_[k];
                    if (token.is_operator(",") || token.is_operator(";") || (in_for && token.is_operator(")"))) {
                        return k;
                    }
                    if (token.is_operator("(") || token.is_operator("[") || token.is_operator("{")) {
                        k = tokens_.matching_or_end(k);
                    }
                }
                return tokens_.size();
            }

            void record(const std::size_t name,
                        const std::string& base_type,
                        const std::size_t declarator_begin,
                        const bool is_const,
                        const bool in_for) {
                VariableInfo variable = make_variable(tokens_, functions_, name, file_path_);
                std::string pointer = declarator_begin < name ? tokens_.text(declarator_begin, name) : std::string();
                variable.var_type = pointer.empty() ? base_type : base_type + " " + pointer;
                if (variable.var_type.empty()) {
                    variable.var_type = "unknown";
                }
                variable.is_mutable = !is_const;
                if (in_for) {
                    variable.scope = VariableScope::Block;
                }
                out_.push_back(std::move(variable));
            }

            const lexer::TokenView& tokens_;
            bool cpp_;
            const std::vector<FunctionInfo>& functions_;
            const std::string& file_path_;
            std::vector<VariableInfo> out_;
        };

        // ------------------------------------------------------------------
        // Assembly
        // ------------------------------------------------------------------

        /**
         * ".equ NAME, value" and ".set NAME, value" symbolic constants.
         */
        std::vector<VariableInfo> scan_assembly_constants(const lexer::TokenView& tokens,
                                                          const std::vector<FunctionInfo>& functions,
                                                          const std::string& file_path) {
            std::vector<VariableInfo> out;
            for (std::size_t i = 0; i + 2 < tokens.size(); ++i) {
                if (!(tokens.is_keyword(i, ".equ") || tokens.is_keyword(i, ".set")) || !tokens.is_identifier(i + 1) ||
                    !tokens.is_operator(i + 2, ",")) {
                    continue;
                }
                std::size_t end = i + 3;
                while (tokens.valid(end) && tokens[end].line == tokens[i].line) {
                    ++end;
                }
                VariableInfo variable = make_variable(tokens, functions, i + 1, file_path);
                variable.var_type = "constant";
                variable.is_mutable = tokens[i].value == ".set";
                variable.initialized_value = tokens.text(i + 3, end);
                out.push_back(std::move(variable));
            }
            return out;
        }
    }

    std::vector<VariableInfo> scan_variables(const lexer::TokenView& tokens,
                                             const Language language,
                                             const std::vector<FunctionInfo>& functions,
                                             const std::string& file_path) {
        switch (language) {
            case Language::Rust:
                return scan_rust_variables(tokens, functions, file_path);
            case Language::Assembly:
                return scan_assembly_constants(tokens, functions, file_path);
            case Language::C:
            case Language::Cpp:
            case Language::Unknown:
                return CDeclarationScanner(tokens, language, functions, file_path).run();
        }
        return {};
    }

}  // namespace cie::symbols::detail
