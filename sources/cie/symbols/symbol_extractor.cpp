//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"

#include <algorithm>

namespace cie::symbols {

    SymbolExtractor::SymbolExtractor(const Language language, std::string file_path)
        : language_(language)
        , file_path_(std::move(file_path)) {}

    SymbolTable SymbolExtractor::extract(const lexer::TokenView& tokens) const {
        SymbolTable table;

        detail::FunctionScan scan;
        switch (language_) {
            case Language::Rust:
                scan = detail::scan_rust_functions(tokens, file_path_);
                break;
            case Language::Assembly:
                scan = detail::scan_assembly_functions(tokens, file_path_);
                break;
            case Language::C:
            case Language::Cpp:
            case Language::Unknown:
                scan = detail::scan_c_functions(tokens, language_, file_path_);
                break;
        }

        table.functions = std::move(scan.functions);
        detail::link_parents(table.functions);

        table.variables = std::move(scan.parameters);
        auto locals = detail::scan_variables(tokens, language_, table.functions, file_path_);
        table.variables.insert(table.variables.end(),
                               std::make_move_iterator(locals.begin()),
                               std::make_move_iterator(locals.end()));
        std::ranges::stable_sort(table.variables, {}, &VariableInfo::token_index);

        table.types = detail::scan_types(tokens, language_);
        table.imports = detail::scan_imports(tokens, language_);
        table.diagnostics = std::move(scan.diagnostics);
        return table;
    }

    namespace detail {

        void link_parents(std::vector<FunctionInfo>& functions) {
            std::vector<std::size_t> open;
            for (std::size_t i = 0; i < functions.size(); ++i) {
                auto& function = functions[i];
                while (!open.empty() && !functions[open.back()].contains_token(function.signature_begin)) {
                    open.pop_back();
                }
                function.parent = open.empty() ? std::nullopt : std::optional<std::size_t>(open.back());
                open.push_back(i);
            }
        }

        std::optional<std::size_t> enclosing_function(const std::vector<FunctionInfo>& functions,
                                                      const std::size_t index) {
            std::optional<std::size_t> innermost;
            for (std::size_t i = 0; i < functions.size(); ++i) {
                const auto& function = functions[i];
                if (!function.contains_token(index)) {
                    continue;
                }
                if (!innermost || function.body_begin >= functions[*innermost].body_begin) {
                    innermost = i;
                }
            }
            return innermost;
        }

        std::vector<std::pair<std::size_t, std::size_t>> split_top_level(const lexer::TokenView& tokens,
                                                                          const std::size_t open,
                                                                          const std::size_t close) {
            std::vector<std::pair<std::size_t, std::size_t>> pieces;
            if (close <= open + 1) {
                return pieces;
            }

            std::size_t start = open + 1;
            int angle = 0;
            for (std::size_t i = open + 1; i < close; ++i) {
                const Token& token = tokens[i];
                if (token.type != TokenType::Operator) {
                    continue;
                }
                if (token.value == "(" || token.value == "[" || token.value == "{") {
                    const std::size_t match = tokens.matching(i);
                    if (match != lexer::TokenView::npos && match < close) {
                        i = match;
                    }
                } else if (token.value == "<") {
                    ++angle;
                } else if (token.value == ">") {
                    angle = std::max(0, angle - 1);
                } else if (token.value == ">>") {
                    angle = std::max(0, angle - 2);
                } else if (token.value == "," && angle == 0) {
                    if (i > start) {
                        pieces.emplace_back(start, i);
                    }
                    start = i + 1;
                }
            }
            if (close > start) {
                pieces.emplace_back(start, close);
            }
            return pieces;
        }

    }  // namespace detail

}  // namespace cie::symbols
