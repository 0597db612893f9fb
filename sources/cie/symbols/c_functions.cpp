//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"
#include "scan_support.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace cie::symbols::detail {

    namespace {
        bool is_storage_word(const std::string_view word) {
            static const std::unordered_set<std::string_view> words = {
                "static", "inline", "extern", "virtual", "explicit", "constexpr", "consteval",
                "friend", "__inline__", "_Noreturn", "register", "thread_local"
            };
            return words.contains(word);
        }

        /**
         * Macro-generated definitions such as SYSCALL_DEFINE3(write, ...):
         * upper case letters, digits and underscores only.
         */
        bool is_macro_name(const std::string_view name) {
            bool has_upper = false;
            for (const char c : name) {
                if (std::islower(static_cast<unsigned char>(c))) {
                    return false;
                }
                if (std::isupper(static_cast<unsigned char>(c))) {
                    has_upper = true;
                }
            }
            return has_upper;
        }

        class CFunctionScanner {
        public:
            CFunctionScanner(const lexer::TokenView& tokens, const Language language, const std::string& file_path)
                : tokens_(tokens)
                , cpp_(language == Language::Cpp)
                , file_path_(file_path) {}

            FunctionScan run() {
                scan_scope(0, tokens_.size(), "");
                return std::move(scan_);
            }

        private:
            /**
             * Walks declarations in [begin, end) at namespace or class level.
             */
            void scan_scope(const std::size_t begin, const std::size_t end, const std::string& prefix) {
                for (std::size_t i = begin; i < end; ++i) {
                    const Token& token = tokens_[i];

                    if (is_directive_start(tokens_, i)) {
                        i = directive_end(tokens_, i);
                        continue;
                    }

                    if (token.is_keyword("namespace")) {
                        std::string name;
                        std::size_t j = i + 1;
                        while (tokens_.valid(j) && (tokens_.is_identifier(j) || tokens_.is_operator(j, "::") ||
                                                    tokens_.is_keyword(j, "inline"))) {
                            if (!tokens_[j].is_keyword("inline")) {
                                name += tokens_[j].value;
                            }
                            ++j;
                        }
                        if (tokens_.is_operator(j, "{")) {
                            const std::size_t close = std::min(tokens_.matching_or_end(j), end);
                            scan_scope(j + 1, close, name.empty() ? prefix : prefix + name + "::");
                            i = close;
                        }
                        continue;
                    }

                    if (token.is_keyword("extern") && tokens_.valid(i + 1) &&
                        tokens_[i + 1].type == TokenType::String && tokens_.is_operator(i + 2, "{")) {
                        const std::size_t close = std::min(tokens_.matching_or_end(i + 2), end);
                        scan_scope(i + 3, close, prefix);
                        i = close;
                        continue;
                    }

                    if (token.is_keyword("template") && tokens_.is_operator(i + 1, "<")) {
                        const std::size_t after = tokens_.skip_angle_brackets(i + 1);
                        if (after > i + 1) {
                            i = after - 1;
                        }
                        continue;
                    }

                    if (token.is_keyword("struct") || token.is_keyword("union") || token.is_keyword("class")) {
                        if (const auto body = aggregate_body(tokens_, i)) {
                            const std::size_t close = std::min(tokens_.matching_or_end(*body), end);
                            if (cpp_) {
                                const std::string name = aggregate_name(i + 1, *body);
                                scan_scope(*body + 1, close, name.empty() ? prefix : prefix + name + "::");
                            }
                            i = close;
                        }
                        continue;
                    }

                    if (token.is_keyword("enum")) {
                        if (const auto body = aggregate_body(tokens_, i)) {
                            i = std::min(tokens_.matching_or_end(*body), end);
                        }
                        continue;
                    }

                    if (token.is_keyword("typedef") || token.is_keyword("using") ||
                        token.is_keyword("static_assert") || token.is_keyword("_Static_assert")) {
                        i = std::min(statement_end(i, end), end);
                        continue;
                    }

                    if (token.is_operator("{")) {
                        i = std::min(tokens_.matching_or_end(i), end);
                        continue;
                    }

                    if (cpp_ && token.is_operator("[") && opens_lambda(i)) {
                        if (const auto body = scan_lambda(i)) {
                            i = *body;
                        }
                        continue;
                    }

                    if (const auto body_close = try_function(i, end, prefix)) {
                        i = *body_close;
                    }
                }
            }

            std::string aggregate_name(const std::size_t begin, const std::size_t end) const {
                for (std::size_t j = begin; j < end; ++j) {
                    if (tokens_.is_operator(j, ":")) {
                        break;
                    }
                    if (tokens_.is_identifier(j) && !tokens_.is_operator(j + 1, "(")) {
                        return tokens_[j].value;
                    }
                }
                return {};
            }

            std::size_t statement_end(std::size_t i, const std::size_t end) const {
                for (; i < end; ++i) {
                    if (tokens_.is_operator(i, ";")) {
                        return i;
                    }
                    if (tokens_.is_operator(i, "{") || tokens_.is_operator(i, "(") || tokens_.is_operator(i, "[")) {
                        i = tokens_.matching_or_end(i);
                    }
                }
                return end;
            }

            bool opens_lambda(const std::size_t i) const {
                if (tokens_.is_operator(i + 1, "[")) {
                    return false;  // [[attribute]]
                }
                if (i > 0) {
                    const Token& prev = tokens_[i - 1];
                    if (prev.type == TokenType::Identifier || prev.type == TokenType::Number ||
                        prev.type == TokenType::String || prev.is_operator(")") || prev.is_operator("]") ||
                        (prev.type == TokenType::Keyword && !prev.is_keyword("return"))) {
                        return false;
                    }
                }
                return true;
            }

            /**
             * Records a lambda "[captures](params) specifiers {body}" whose
             * capture list opens at bracket. Returns its closing brace.
             */
            std::optional<std::size_t> scan_lambda(const std::size_t bracket) {
                const std::size_t capture_close = tokens_.matching(bracket);
                if (capture_close == lexer::TokenView::npos) {
                    return std::nullopt;
                }

                std::size_t k = capture_close + 1;
                std::optional<std::size_t> paren;
                if (tokens_.is_operator(k, "(")) {
                    paren = k;
                    k = tokens_.matching_or_end(k) + 1;
                }
                std::string return_type = "auto";
                while (tokens_.valid(k) && !tokens_.is_operator(k, "{")) {
                    if (tokens_.is_operator(k, "->")) {
                        const std::size_t type_begin = k + 1;
                        while (tokens_.valid(k) && !tokens_.is_operator(k, "{") && !tokens_.is_operator(k, ";")) {
                            ++k;
                        }
                        return_type = tokens_.text(type_begin, k);
                        break;
                    }
                    if (tokens_[k].type != TokenType::Keyword) {
                        return std::nullopt;
                    }
                    if (tokens_.is_operator(k + 1, "(")) {
                        k = tokens_.matching_or_end(k + 1);  // noexcept(expr)
                    }
                    ++k;
                }
                if (!tokens_.is_operator(k, "{")) {
                    return std::nullopt;
                }

                FunctionInfo function;
                function.name = anonymous_name("lambda", tokens_[bracket]);
                function.signature = tokens_.text(bracket, k);
                function.return_type = std::move(return_type);
                function.location = location_of(tokens_, bracket, file_path_);
                function.signature_begin = bracket;
                function.start_line = tokens_[bracket].line;
                function.is_closure = true;
                if (paren) {
                    add_parameters(function, *paren);
                }
                return finish_body(std::move(function), k);
            }

            /**
             * Checks whether token i names a function definition and records
             * it. Returns the closing brace of the body when it does.
             */
            std::optional<std::size_t> try_function(const std::size_t i, const std::size_t end, const std::string& prefix) {
                std::size_t name_end = i;
                std::string name;

                if (tokens_.is_keyword(i, "operator")) {
                    std::size_t j = i + 1;
                    if (tokens_.is_operator(j, "(") && tokens_.is_operator(j + 1, ")")) {
                        j += 2;
                    }
                    while (tokens_.valid(j) && !tokens_.is_operator(j, "(") && j < end) {
                        ++j;
                    }
                    name = "operator" + (j > i + 1 ? tokens_.text(i + 1, j) : std::string());
                    name.erase(std::remove(name.begin(), name.end(), ' '), name.end());
                    name_end = j - 1;
                } else if (tokens_.is_identifier(i)) {
                    name = tokens_[i].value;
                } else {
                    return std::nullopt;
                }

                const std::size_t paren = name_end + 1;
                if (!tokens_.is_operator(paren, "(") || paren >= end) {
                    return std::nullopt;
                }

                // Qualification written before the name: "ns::Type::method", "~Type".
                std::size_t name_begin = i;
                if (name_begin > 0 && tokens_.is_operator(name_begin - 1, "~")) {
                    --name_begin;
                    name = "~" + name;
                }
                while (name_begin >= 2 && tokens_.is_operator(name_begin - 1, "::") &&
                       tokens_.is_identifier(name_begin - 2)) {
                    name = tokens_[name_begin - 2].value + "::" + name;
                    name_begin -= 2;
                }
                if (name_begin > 0 && tokens_.is_operator(name_begin - 1, "::")) {
                    return std::nullopt;  // "::f" or "T<U>::f" call expression
                }

                if (!accepts_previous(name_begin)) {
                    return std::nullopt;
                }

                const std::size_t paren_close = tokens_.matching(paren);
                if (paren_close == lexer::TokenView::npos) {
                    return std::nullopt;
                }
                const auto body = body_after_parameters(paren_close + 1);
                if (!body) {
                    return std::nullopt;
                }

                const std::size_t signature_begin = signature_start(name_begin);
                std::string return_type;
                for (std::size_t j = signature_begin; j < name_begin; ++j) {
                    const Token& token = tokens_[j];
                    if ((token.type == TokenType::Keyword && is_storage_word(token.value)) ||
                        (token.type == TokenType::Identifier && token.value.starts_with("__"))) {
                        continue;
                    }
                    if (!return_type.empty() && token.value != "*" && token.value != "&" &&
                        token.value != "::" && !return_type.ends_with("::") && token.value != "<" &&
                        token.value != ">" && !return_type.ends_with("<")) {
                        return_type.push_back(' ');
                    }
                    return_type += token.value;
                }

                if (return_type.empty() && is_macro_name(name)) {
                    const auto args = split_top_level(tokens_, paren, paren_close);
                    if (!args.empty()) {
                        name += "(" + tokens_.text(args.front().first, args.front().second) + ")";
                    }
                }

                FunctionInfo function;
                function.name = prefix + name;
                function.signature = tokens_.text(signature_begin, *body);
                function.return_type = return_type.empty() ? "void" : return_type;
                function.location = location_of(tokens_, i, file_path_);
                function.signature_begin = signature_begin;
                function.start_line = tokens_[signature_begin].line;
                add_parameters(function, paren);

                return finish_body(std::move(function), *body);
            }

            /**
             * A definition name follows a type, a declarator or the start of
             * a declaration; anything else makes it a call.
             */
            bool accepts_previous(const std::size_t name_begin) const {
                if (name_begin == 0) {
                    return true;
                }
                const Token& prev = tokens_[name_begin - 1];
                switch (prev.type) {
                    case TokenType::Identifier:
                        return true;
                    case TokenType::Keyword:
                        return !is_control_keyword(prev.value) && prev.value != "operator";
                    case TokenType::Operator:
                        if (prev.value == "*" || prev.value == "&" || prev.value == "&&" || prev.value == ">" ||
                            prev.value == ";" || prev.value == "{" || prev.value == "}" || prev.value == ">>") {
                            return true;
                        }
                        if (prev.value == "]") {
                            return tokens_.is_operator(name_begin - 2, "]");  // [[nodiscard]] f()
                        }
                        if (prev.value == ":" && name_begin >= 2) {
                            const Token& label = tokens_[name_begin - 2];
                            return label.is_keyword("public") || label.is_keyword("private") ||
                                   label.is_keyword("protected");
                        }
                        if (prev.value == ")") {
                            // __attribute__((...)) or alignas(...) before the name
                            const std::size_t open = tokens_.matching(name_begin - 1);
                            return open != lexer::TokenView::npos && open > 0 && tokens_.is_operator(open - 1, "(") &&
                                   open >= 2 && tokens_.is_keyword(open - 2, "__attribute__");
                        }
                        return false;
                    default:
                        return false;
                }
            }

            /**
             * Skips qualifiers, trailing return types and constructor
             * initializer lists after the parameter list. Returns the body
             * brace, or nothing for a declaration or expression.
             */
            std::optional<std::size_t> body_after_parameters(std::size_t k) const {
                while (tokens_.valid(k)) {
                    const Token& token = tokens_[k];
                    if (token.is_operator("{")) {
                        return k;
                    }
                    if (token.type == TokenType::Keyword &&
                        (token.value == "const" || token.value == "volatile" || token.value == "noexcept" ||
                         token.value == "override" || token.value == "final" || token.value == "throw" ||
                         token.value == "__attribute__" || token.value == "requires")) {
                        if (tokens_.is_operator(k + 1, "(")) {
                            k = tokens_.matching_or_end(k + 1);
                        }
                        ++k;
                        continue;
                    }
                    if (token.type == TokenType::Identifier && (token.value == "override" || token.value == "final")) {
                        ++k;
                        continue;
                    }
                    if (token.is_operator("&") || token.is_operator("&&")) {
                        ++k;
                        continue;
                    }
                    if (token.is_operator("->") && cpp_) {
                        ++k;
                        while (tokens_.valid(k) && !tokens_.is_operator(k, "{") && !tokens_.is_operator(k, ";") &&
                               !tokens_.is_operator(k, "=")) {
                            if (tokens_.is_operator(k, "(") || tokens_.is_operator(k, "[")) {
                                k = tokens_.matching_or_end(k);
                            }
                            ++k;
                        }
                        continue;
                    }
                    if (token.is_operator(":") && cpp_) {
                        return initializer_list_body(k + 1);
                    }
                    return std::nullopt;
                }
                return std::nullopt;
            }

            /**
             * After "member(x)" or "member{x}" a brace opens the body; after a
             * member name it opens a brace initializer.
             */
            std::optional<std::size_t> initializer_list_body(std::size_t k) const {
                bool after_initializer = false;
                while (tokens_.valid(k)) {
                    const Token& token = tokens_[k];
                    if (token.is_operator("{")) {
                        if (after_initializer) {
                            return k;
                        }
                        k = tokens_.matching_or_end(k) + 1;
                        after_initializer = true;
                        continue;
                    }
                    if (token.is_operator("(")) {
                        k = tokens_.matching_or_end(k) + 1;
                        after_initializer = true;
                        continue;
                    }
                    if (token.is_operator(",")) {
                        after_initializer = false;
                        ++k;
                        continue;
                    }
                    if (token.type == TokenType::Identifier || token.is_operator("::") || token.is_operator("...")) {
                        after_initializer = false;
                        ++k;
                        continue;
                    }
                    if (token.is_operator("<")) {
                        const std::size_t after = tokens_.skip_angle_brackets(k);
                        if (after == k) {
                            return std::nullopt;
                        }
                        k = after;
                        continue;
                    }
                    return std::nullopt;
                }
                return std::nullopt;
            }

            /**
             * First token of the declaration whose declarator name begins at
             * name_begin: walks back over specifiers, types and template
             * arguments, stopping at a template header.
             */
            std::size_t signature_start(std::size_t begin) const {
                while (begin > 0) {
                    const Token& prev = tokens_[begin - 1];
                    if (prev.type == TokenType::Identifier ||
                        (prev.type == TokenType::Keyword && !is_control_keyword(prev.value) &&
                         prev.value != "public" && prev.value != "private" && prev.value != "protected")) {
                        --begin;
                        continue;
                    }
                    if (prev.is_operator("*") || prev.is_operator("&") || prev.is_operator("&&") ||
                        prev.is_operator("::")) {
                        --begin;
                        continue;
                    }
                    if (prev.is_operator(">") || prev.is_operator(">>")) {
                        const auto open = template_open(begin - 1);
                        if (!open || (*open > 0 && tokens_.is_keyword(*open - 1, "template"))) {
                            break;
                        }
                        begin = *open;
                        continue;
                    }
                    if (prev.is_operator(")") && begin >= 2) {
                        const std::size_t open = tokens_.matching(begin - 1);
                        if (open != lexer::TokenView::npos && open >= 2 && tokens_.is_operator(open - 1, "(") &&
                            tokens_.is_keyword(open - 2, "__attribute__")) {
                            begin = open - 2;
                            continue;
                        }
                    }
                    break;
                }
                return begin;
            }

            std::optional<std::size_t> template_open(const std::size_t close) const {
                int depth = 0;
                for (std::size_t j = close + 1; j-- > 0;) {
                    const Token& token = tokens_[j];
                    if (token.is_operator(">")) {
                        ++depth;
                    } else if (token.is_operator(">>")) {
                        depth += 2;
                    } else if (token.is_operator("<")) {
                        if (--depth <= 0) {
                            return j;
                        }
                    } else if (token.is_operator(";") || token.is_operator("{") || token.is_operator("}")) {
                        return std::nullopt;
                    }
                }
                return std::nullopt;
            }

            void add_parameters(FunctionInfo& function, const std::size_t paren) {
                const std::size_t close = tokens_.matching_or_end(paren);
                for (const auto& [begin, end] : split_top_level(tokens_, paren, close)) {
                    const std::string text = tokens_.text(begin, end);
                    if (text == "void") {
                        continue;
                    }
                    function.parameters.push_back(text);
                    if (auto variable = c_parameter(tokens_, begin, end, file_path_)) {
                        variable->function_index = scan_.functions.size();
                        scan_.parameters.push_back(std::move(*variable));
                    }
                }
            }

            /**
             * Stores the function, then records lambdas nested in its body.
             */
            std::size_t finish_body(FunctionInfo function, const std::size_t open) {
                function.body_begin = open;
                const std::size_t close = tokens_.matching(open);
                if (close == lexer::TokenView::npos) {
                    function.body_end = tokens_.size();
                    scan_.diagnostics.push_back(unclosed_body(file_path_, tokens_[open], function.name));
                } else {
                    function.body_end = close;
                }
                function.end_line = std::max(function.start_line, end_line_of(tokens_, close));

                const std::size_t body_end = function.body_end;
                scan_.functions.push_back(std::move(function));

                if (cpp_) {
                    for (std::size_t j = open + 1; j < body_end; ++j) {
                        if (tokens_.is_operator(j, "[") && opens_lambda(j)) {
                            if (const auto nested_close = scan_lambda(j)) {
                                j = *nested_close;
                            }
                        }
                    }
                }
                return std::min(body_end, tokens_.size() - 1);
            }

            const lexer::TokenView& tokens_;
            bool cpp_;
            const std::string& file_path_;
            FunctionScan scan_;
        };
    }

    FunctionScan scan_c_functions(const lexer::TokenView& tokens, const Language language, const std::string& file_path) {
        return CFunctionScanner(tokens, language, file_path).run();
    }

}  // namespace cie::symbols::detail
