//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/calls/call_site_resolver.hpp"
#include "cie/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace cie::calls {

    namespace {
        /**
         * Keywords after which "name(" declares something instead of
         * calling it.
         */
        bool is_declaring_keyword(const std::string_view word) {
            static const std::unordered_set<std::string_view> words = {
                "void", "int", "char", "short", "long", "float", "double", "signed", "unsigned",
                "bool", "_Bool", "auto", "const", "static", "struct", "union", "enum", "class",
                "fn", "extern", "inline", "virtual", "volatile", "register", "typename", "new",
                "wchar_t", "char8_t", "char16_t", "char32_t", "constexpr", "explicit"
            };
            return words.contains(word);
        }

        bool is_path_root(const Token& token) {
            return token.type == TokenType::Identifier ||
                   token.is_keyword("self") || token.is_keyword("Self") || token.is_keyword("super") ||
                   token.is_keyword("crate");
        }

        /**
         * True for "x.name(" or "x->name(" where x is anything but a bare
         * self or this. Such a call is never classified as recursion.
         */
        bool has_foreign_receiver(const lexer::TokenView& tokens, const std::size_t first) {
            if (first == 0 || !(tokens.is_operator(first - 1, ".") || tokens.is_operator(first - 1, "->"))) {
                return false;
            }
            if (first < 2) {
                return true;
            }
            const Token& receiver = tokens[first - 2];
            const bool bare_self = receiver.is_keyword("self") || receiver.is_keyword("this");
            return !bare_self || (first >= 3 && (tokens.is_operator(first - 3, ".") ||
                                                 tokens.is_operator(first - 3, "->") ||
                                                 tokens.is_operator(first - 3, "::")));
        }

        bool is_call_mnemonic(const std::string_view mnemonic) {
            return mnemonic == "call" || mnemonic == "callq" || mnemonic == "bl" || mnemonic == "blx" ||
                   mnemonic == "jal";
        }
    }

    std::string_view simple_name(const std::string_view name) noexcept {
        const auto pos = name.rfind("::");
        return pos == std::string_view::npos ? name : name.substr(pos + 2);
    }

    std::string strip_generics(const std::string_view name) {
        std::string stripped;
        stripped.reserve(name.size());
        int angle = 0;
        for (std::size_t i = 0; i < name.size(); ++i) {
            const char c = name[i];
            if (c == '<' && i > 0 && (std::isalnum(static_cast<unsigned char>(name[i - 1])) || name[i - 1] == '_')) {
                ++angle;
            } else if (c == '>' && angle > 0) {
                --angle;
            } else if (angle == 0) {
                stripped.push_back(c);
            }
        }
        return stripped;
    }

    CallSiteResolver::CallSiteResolver(const Language language, const heuristics::CallConfig& config)
        : language_(language)
        , config_(config) {}

    CallKind CallSiteResolver::classify(const std::string& callee,
                                        const FunctionInfo& caller,
                                        const std::vector<FunctionInfo>& functions) const {
        return classify(callee, caller, functions, false);
    }

    CallKind CallSiteResolver::classify(const std::string& callee,
                                        const FunctionInfo& caller,
                                        const std::vector<FunctionInfo>& functions,
                                        const bool foreign_receiver) const {
        const std::string_view callee_simple = simple_name(callee);
        const bool qualified = callee_simple.size() != callee.size();

        if (!foreign_receiver &&
            (callee == caller.name || (!qualified && callee_simple == caller.simple_name()))) {
            return CallKind::Recursive;
        }
        if (std::ranges::find(config_.system_call_names, callee_simple) != config_.system_call_names.end()) {
            return CallKind::SystemCall;
        }
        const bool defined_here = std::ranges::any_of(functions, [&](const FunctionInfo& function) {
            return function.name == callee || function.simple_name() == callee_simple;
        });
        return defined_here ? CallKind::Local : CallKind::CrossFile;
    }

    std::vector<CallSite> CallSiteResolver::resolve(const lexer::TokenView& tokens,
                                                    const std::vector<FunctionInfo>& functions,
                                                    const analysis::Owners& owners,
                                                    const std::string& file_path) const {
        std::vector<CallSite> sites;

        std::set<std::pair<std::size_t, std::size_t>> definition_names;
        for (const auto& function : functions) {
            definition_names.emplace(function.location.line, function.location.column);
        }

        const auto add = [&](const std::size_t caller, const std::string& callee, const std::size_t first,
                             const std::size_t name_index) {
            const FunctionInfo& function = functions[caller];
            sites.push_back(CallSite{
                function.name,
                caller,
                callee,
                classify(callee, function, functions, has_foreign_receiver(tokens, first)),
                CodeLocation{file_path, tokens[first].line, tokens[first].start_col},
                name_index
            });
        };

        for (std::size_t i = 0; i < tokens.size() && i < owners.size(); ++i) {
            if (!owners[i]) {
                continue;
            }
            const Token& token = tokens[i];

            if (language_ == Language::Assembly) {
                if (token.type == TokenType::Keyword && is_call_mnemonic(string_utils::to_lower(token.value)) &&
                    tokens.is_identifier(i + 1) && tokens[i + 1].line == token.line) {
                    add(*owners[i], tokens[i + 1].value, i + 1, i + 1);
                }
                continue;
            }

            if (token.type != TokenType::Identifier) {
                continue;
            }

            std::size_t paren = i + 1;
            if (language_ == Language::Rust && tokens.is_operator(paren, "::") && tokens.is_operator(paren + 1, "<")) {
                const std::size_t after = tokens.skip_angle_brackets(paren + 1);
                if (after > paren + 1) {
                    paren = after;  // turbofish: collect::<Vec<_>>()
                }
            }
            if (!tokens.is_operator(paren, "(")) {
                continue;
            }
            if (definition_names.contains({token.line, token.start_col})) {
                continue;
            }
            if (std::ranges::find(config_.ignored_callees, token.value) != config_.ignored_callees.end()) {
                continue;
            }

            std::size_t first = i;
            std::string callee = token.value;
            while (first >= 2 && tokens.is_operator(first - 1, "::") && is_path_root(tokens[first - 2])) {
                callee = tokens[first - 2].value + "::" + callee;
                first -= 2;
            }

            if (first > 0) {
                const Token& prev = tokens[first - 1];
                if (prev.type == TokenType::Identifier) {
                    continue;  // "Type name(args)" declares an object
                }
                if (prev.type == TokenType::Keyword && is_declaring_keyword(prev.value)) {
                    continue;
                }
            }

            add(*owners[i], callee, first, i);
        }
        return sites;
    }

}  // namespace cie::calls
