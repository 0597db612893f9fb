//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"
#include "scan_support.hpp"

#include <algorithm>

namespace cie::symbols::detail {

    namespace {
        /**
         * Skips "#[attr]" groups and a "pub" / "pub(crate)" marker in a
         * Rust field or variant. Returns the first remaining index and
         * whether the item is public.
         */
        std::pair<std::size_t, bool> skip_rust_decorations(const lexer::TokenView& tokens,
                                                           std::size_t i,
                                                           const std::size_t end) {
            bool is_public = false;
            while (i < end) {
                if (tokens.is_operator(i, "#") && tokens.is_operator(i + 1, "[")) {
                    i = tokens.matching_or_end(i + 1) + 1;
                    continue;
                }
                if (tokens.is_keyword(i, "pub")) {
                    is_public = true;
                    ++i;
                    if (tokens.is_operator(i, "(")) {
                        i = tokens.matching_or_end(i) + 1;
                    }
                    continue;
                }
                break;
            }
            return {i, is_public};
        }

        std::size_t rust_item_start(const lexer::TokenView& tokens, std::size_t keyword) {
            if (keyword > 0 && tokens.is_operator(keyword - 1, ")")) {
                const std::size_t open = tokens.matching(keyword - 1);
                if (open != lexer::TokenView::npos && open > 0 && tokens.is_keyword(open - 1, "pub")) {
                    return open - 1;
                }
            }
            if (keyword > 0 && tokens.is_keyword(keyword - 1, "pub")) {
                return keyword - 1;
            }
            return keyword;
        }

        /**
         * First "{", "(" or ";" after a Rust item header, skipping generics
         * and where clauses.
         */
        std::size_t rust_item_body(const lexer::TokenView& tokens, std::size_t i) {
            for (; tokens.valid(i); ++i) {
                if (tokens.is_operator(i, "{") || tokens.is_operator(i, "(") || tokens.is_operator(i, ";")) {
                    return i;
                }
                if (tokens.is_operator(i, "<")) {
                    const std::size_t after = tokens.skip_angle_brackets(i);
                    if (after > i) {
                        i = after - 1;
                    }
                }
            }
            return tokens.size();
        }

        void scan_rust_type(const lexer::TokenView& tokens, const std::size_t keyword, std::vector<TypeInfo>& out) {
            const std::string& kind = tokens[keyword].value;
            const std::size_t name = keyword + 1;
            if (!tokens.is_identifier(name)) {
                return;
            }

            TypeInfo type;
            type.name = tokens[name].value;
            type.line = tokens[name].line;
            const std::size_t start = rust_item_start(tokens, keyword);

            if (kind == "type") {
                const std::size_t semicolon = find_top_level(tokens, name, tokens.size(), ";");
                if (find_top_level(tokens, name, semicolon, "=") == semicolon) {
                    return;  // associated type declaration
                }
                type.definition = tokens.text(start, semicolon);
                out.push_back(std::move(type));
                return;
            }

            const std::size_t body = rust_item_body(tokens, name + 1);
            type.definition = tokens.text(start, body);
            if (!tokens.valid(body) || kind == "trait") {
                out.push_back(std::move(type));
                return;
            }

            if (tokens.is_operator(body, "{") || tokens.is_operator(body, "(")) {
                const std::size_t close = tokens.matching_or_end(body);
                std::size_t position = 0;
                for (const auto& [begin, end] : split_top_level(tokens, body, close)) {
                    const auto [field_begin, is_public] = skip_rust_decorations(tokens, begin, end);
                    if (field_begin >= end) {
                        continue;
                    }
                    TypeField field;
                    field.is_public = is_public;
                    if (kind == "enum") {
                        field.name = tokens[field_begin].value;
                        field.field_type = "variant";
                        field.is_public = true;
                    } else if (tokens.is_operator(body, "(")) {
                        field.name = std::to_string(position);
                        field.field_type = tokens.text(field_begin, end);
                    } else {
                        const std::size_t colon = find_top_level(tokens, field_begin, end, ":");
                        field.name = tokens[field_begin].value;
                        field.field_type = colon < end ? tokens.text(colon + 1, end) : "unknown";
                    }
                    ++position;
                    type.fields.push_back(std::move(field));
                }
            }
            out.push_back(std::move(type));
        }

        std::vector<TypeInfo> scan_rust_types(const lexer::TokenView& tokens) {
            std::vector<TypeInfo> out;
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                if (tokens.is_keyword(i, "struct") || tokens.is_keyword(i, "enum") || tokens.is_keyword(i, "union") ||
                    tokens.is_keyword(i, "trait") || tokens.is_keyword(i, "type")) {
                    scan_rust_type(tokens, i, out);
                }
            }
            return out;
        }

        // ------------------------------------------------------------------
        // C and C++
        // ------------------------------------------------------------------

        /**
         * Member declarations of a struct/union/class body. Methods and
         * nested definitions are skipped, access labels switch visibility.
         */
        std::vector<TypeField> c_fields(const lexer::TokenView& tokens,
                                        const std::size_t open,
                                        const std::size_t close,
                                        bool is_public) {
            std::vector<TypeField> fields;
            std::size_t start = open + 1;
            for (std::size_t i = open + 1; i <= close && i < tokens.size(); ++i) {
                const Token& token = tokens[i];
                if ((token.is_keyword("public") || token.is_keyword("private") || token.is_keyword("protected")) &&
                    tokens.is_operator(i + 1, ":")) {
                    is_public = token.value == "public";
                    start = i + 2;
                    ++i;
                    continue;
                }
                if (token.is_operator("{")) {
                    // method body or nested definition
                    i = tokens.matching_or_end(i);
                    if (!tokens.is_keyword(start, "struct") && !tokens.is_keyword(start, "union") &&
                        !tokens.is_keyword(start, "enum")) {
                        start = i + 1;
                    }
                    continue;
                }
                if (!token.is_operator(";") && i != close) {
                    continue;
                }

                const std::size_t end = i;
                if (start < end && !tokens.is_keyword(start, "using") && !tokens.is_keyword(start, "friend") &&
                    !tokens.is_keyword(start, "typedef") && !tokens.is_keyword(start, "static_assert") &&
                    !tokens.is_keyword(start, "template") && find_top_level(tokens, start, end, "(") == end) {
                    std::size_t first_end = find_top_level(tokens, start, end, ",");
                    std::optional<std::size_t> name;
                    std::size_t base_end = end;
                    for (std::size_t j = start; j < first_end; ++j) {
                        if (tokens.is_operator(j, "[") || tokens.is_operator(j, "=") || tokens.is_operator(j, ":")) {
                            break;
                        }
                        if (tokens.is_operator(j, "{")) {
                            j = tokens.matching_or_end(j);
                            name.reset();
                            continue;
                        }
                        if (tokens.is_identifier(j)) {
                            name = j;
                        }
                    }
                    if (name && *name > start) {
                        base_end = *name;
                        const std::string base_type = tokens.text(start, base_end);
                        fields.push_back(TypeField{tokens[*name].value, base_type, is_public});

                        // "int x, *y;"
                        while (first_end < end) {
                            std::size_t next = first_end + 1;
                            const std::size_t piece_end = find_top_level(tokens, next, end, ",");
                            std::string pointer;
                            while (tokens.is_operator(next, "*") || tokens.is_operator(next, "&")) {
                                pointer += tokens[next].value;
                                ++next;
                            }
                            if (tokens.is_identifier(next)) {
                                fields.push_back(TypeField{
                                    tokens[next].value,
                                    pointer.empty() ? base_type : base_type + " " + pointer,
                                    is_public
                                });
                            }
                            first_end = piece_end;
                        }
                    }
                }
                start = i + 1;
            }
            return fields;
        }

        std::vector<TypeField> c_enumerators(const lexer::TokenView& tokens, const std::size_t open, const std::size_t close) {
            std::vector<TypeField> fields;
            for (const auto& [begin, end] : split_top_level(tokens, open, close)) {
                if (tokens.is_identifier(begin)) {
                    fields.push_back(TypeField{tokens[begin].value, "variant", true});
                }
            }
            return fields;
        }

        class CTypeScanner {
        public:
            explicit CTypeScanner(const lexer::TokenView& tokens)
                : tokens_(tokens) {}

            std::vector<TypeInfo> run() {
                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    if (is_directive_start(tokens_, i)) {
                        i = directive_end(tokens_, i);
                        continue;
                    }
                    const Token& token = tokens_[i];
                    if (token.is_keyword("typedef")) {
                        i = scan_typedef(i);
                    } else if ((token.is_keyword("struct") || token.is_keyword("union") ||
                                token.is_keyword("class") || token.is_keyword("enum")) &&
                               !(i > 0 && tokens_.is_keyword(i - 1, "enum"))) {
                        scan_aggregate(i, std::nullopt);
                    } else if (token.is_keyword("using") && tokens_.is_identifier(i + 1) &&
                               tokens_.is_operator(i + 2, "=")) {
                        const std::size_t semicolon = find_top_level(tokens_, i, tokens_.size(), ";");
                        out_.push_back(TypeInfo{tokens_[i + 1].value, tokens_.text(i, semicolon), tokens_[i + 1].line, {}, false});
                        i = std::max(i, semicolon == tokens_.size() ? i : semicolon);
                    }
                }
                return std::move(out_);
            }

        private:
            /**
             * Records the struct/union/class/enum whose keyword is at i when
             * it has a body. Returns the closing brace, or nothing.
             */
            std::optional<std::size_t> scan_aggregate(const std::size_t keyword, const std::optional<std::size_t> typedef_start) {
                const auto open = aggregate_body(tokens_, keyword);
                if (!open) {
                    return std::nullopt;
                }
                const std::size_t close = tokens_.matching_or_end(*open);
                const std::string& kind = tokens_[keyword].value;

                std::optional<std::size_t> name;
                for (std::size_t j = keyword + 1; j < *open; ++j) {
                    if (tokens_.is_operator(j, ":")) {
                        break;
                    }
                    if (tokens_.is_identifier(j) && !tokens_.is_operator(j + 1, "(") && !tokens_.is_operator(j + 1, "::")) {
                        name = j;
                        break;
                    }
                }
                if (typedef_start && tokens_.is_identifier(close + 1)) {
                    name = close + 1;
                }
                if (!name) {
                    return close;  // anonymous member or variable type
                }

                TypeInfo type;
                type.name = tokens_[*name].value;
                type.line = tokens_[*name].line;
                type.definition = tokens_.text(typedef_start.value_or(keyword), *open);
                if (typedef_start) {
                    type.definition += " " + type.name;
                }
                type.fields = kind == "enum"
                    ? c_enumerators(tokens_, *open, close)
                    : c_fields(tokens_, *open, close, kind != "class");
                out_.push_back(std::move(type));
                return close;
            }

            std::size_t scan_typedef(const std::size_t keyword) {
                const std::size_t semicolon = find_top_level(tokens_, keyword, tokens_.size(), ";");
                const std::size_t tag = keyword + 1;
                if (tokens_.is_keyword(tag, "struct") || tokens_.is_keyword(tag, "union") || tokens_.is_keyword(tag, "enum")) {
                    if (const auto close = scan_aggregate(tag, keyword)) {
                        return *close;
                    }
                }

                // "typedef int (*handler_t)(int);" names the pointer inside the first group.
                std::optional<std::size_t> name;
                for (std::size_t j = tag; j < semicolon; ++j) {
                    if (tokens_.is_operator(j, "(") && tokens_.is_operator(j + 1, "*") && tokens_.is_identifier(j + 2)) {
                        name = j + 2;
                        break;
                    }
                    if (tokens_.is_operator(j, "[") || tokens_.is_operator(j, "(")) {
                        j = tokens_.matching_or_end(j);
                        continue;
                    }
                    if (tokens_.is_identifier(j)) {
                        name = j;
                    }
                }
                if (name) {
                    out_.push_back(TypeInfo{
                        tokens_[*name].value, tokens_.text(keyword, semicolon), tokens_[*name].line, {}, false
                    });
                }
                return semicolon == tokens_.size() ? keyword : semicolon;
            }

            const lexer::TokenView& tokens_;
            std::vector<TypeInfo> out_;
        };

        // ------------------------------------------------------------------
        // Imports
        // ------------------------------------------------------------------

        std::string unquote(const std::string& literal) {
            const auto open = literal.find('"');
            const auto close = literal.rfind('"');
            if (open == std::string::npos || close <= open) {
                return literal;
            }
            return literal.substr(open + 1, close - open - 1);
        }

        std::vector<ImportInfo> scan_rust_imports(const lexer::TokenView& tokens) {
            std::vector<ImportInfo> out;
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                if (tokens.is_keyword(i, "use")) {
                    const std::size_t semicolon = find_top_level(tokens, i + 1, tokens.size(), ";");
                    std::size_t begin = i + 1;
                    if (tokens.is_operator(begin, "::")) {
                        ++begin;
                    }
                    if (begin >= semicolon) {
                        continue;
                    }

                    ImportInfo import;
                    import.line = tokens[i].line;
                    const Token& root = tokens[begin];
                    import.is_external = !(root.is_keyword("crate") || root.is_keyword("self") || root.is_keyword("super"));

                    const std::size_t group = find_top_level(tokens, begin, semicolon, "{");
                    if (group < semicolon) {
                        const std::size_t close = tokens.matching_or_end(group);
                        const std::size_t module_end = tokens.is_operator(group - 1, "::") ? group - 1 : group;
                        import.module = tokens.text(begin, module_end);
                        for (const auto& [b, e] : split_top_level(tokens, group, close)) {
                            import.items.push_back(tokens.text(b, e));
                        }
                    } else {
                        std::size_t last_separator = semicolon;
                        for (std::size_t j = begin; j < semicolon; ++j) {
                            if (tokens.is_operator(j, "::")) {
                                last_separator = j;
                            }
                        }
                        if (last_separator < semicolon) {
                            import.module = tokens.text(begin, last_separator);
                            import.items.push_back(tokens.text(last_separator + 1, semicolon));
                        } else {
                            import.module = tokens.text(begin, semicolon);
                        }
                    }
                    out.push_back(std::move(import));
                    i = semicolon;
                } else if (tokens.is_keyword(i, "extern") && tokens.is_keyword(i + 1, "crate") && tokens.is_identifier(i + 2)) {
                    out.push_back(ImportInfo{tokens[i + 2].value, {}, true, tokens[i].line});
                } else if (tokens.is_keyword(i, "mod") && tokens.is_identifier(i + 1) && tokens.is_operator(i + 2, ";")) {
                    out.push_back(ImportInfo{tokens[i + 1].value, {}, false, tokens[i].line});
                }
            }
            return out;
        }

        std::vector<ImportInfo> scan_c_imports(const lexer::TokenView& tokens) {
            std::vector<ImportInfo> out;
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                if (!is_directive_start(tokens, i)) {
                    continue;
                }
                const std::size_t end = directive_end(tokens, i);
                const std::size_t directive = i + 1;
                if (directive <= end && tokens.valid(directive) && tokens[directive].value == "include" &&
                    directive + 1 <= end) {
                    const Token& target = tokens[directive + 1];
                    if (target.type == TokenType::String) {
                        out.push_back(ImportInfo{unquote(target.value), {}, false, tokens[i].line});
                    } else if (target.is_operator("<")) {
                        std::size_t close = directive + 2;
                        while (close <= end && !tokens.is_operator(close, ">")) {
                            ++close;
                        }
                        out.push_back(ImportInfo{tokens.text(directive + 2, close), {}, true, tokens[i].line});
                    }
                }
                i = end;
            }
            return out;
        }

        std::vector<ImportInfo> scan_assembly_imports(const lexer::TokenView& tokens) {
            std::vector<ImportInfo> out;
            for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
                if (tokens.is_keyword(i, ".include") && tokens[i + 1].type == TokenType::String) {
                    out.push_back(ImportInfo{unquote(tokens[i + 1].value), {}, false, tokens[i].line});
                }
            }
            return out;
        }
    }

    std::vector<TypeInfo> scan_types(const lexer::TokenView& tokens, const Language language) {
        switch (language) {
            case Language::Rust:
                return scan_rust_types(tokens);
            case Language::Assembly:
                return {};
            case Language::C:
            case Language::Cpp:
            case Language::Unknown:
                return CTypeScanner(tokens).run();
        }
        return {};
    }

    std::vector<ImportInfo> scan_imports(const lexer::TokenView& tokens, const Language language) {
        switch (language) {
            case Language::Rust:
                return scan_rust_imports(tokens);
            case Language::Assembly:
                return scan_assembly_imports(tokens);
            case Language::C:
            case Language::Cpp:
            case Language::Unknown:
                return scan_c_imports(tokens);
        }
        return {};
    }

}  // namespace cie::symbols::detail
