//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_SYMBOL_EXTRACTOR_HPP
#define CIE_SYMBOL_EXTRACTOR_HPP

/**
 * @file symbol_extractor.hpp
 * @brief Finds functions, variables, types and imports in a token stream.
 *
 * Function bodies are delimited by brace matching from the opening brace
 * after the signature; an unclosed body ends at end of file and is reported
 * as a diagnostic. Nested functions and closures become separate entries
 * whose line range lies inside the enclosing function, and whose parent
 * index points at it.
 *
 * Names are qualified where a dialect scopes them (Rust impl/trait/mod
 * blocks, C++ namespaces and classes) so that one file never defines the
 * same name twice for ordinary code.
 */

#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <string>
#include <vector>

namespace cie::symbols {

    struct SymbolTable {
        std::vector<FunctionInfo> functions;
        std::vector<VariableInfo> variables;
        std::vector<TypeInfo> types;
        std::vector<ImportInfo> imports;
        std::vector<Diagnostic> diagnostics;
    };

    class SymbolExtractor {
    public:
        SymbolExtractor(Language language, std::string file_path);

        /**
         * Extracts every symbol kind. Never fails; recoveries are reported
         * in SymbolTable::diagnostics.
         */
        [[nodiscard]] SymbolTable extract(const lexer::TokenView& tokens) const;

        [[nodiscard]] Language language() const noexcept {
            return language_;
        }

    private:
        Language language_;
        std::string file_path_;
    };

    namespace detail {

        /**
         * Output of the function scanners: definitions plus the parameters
         * they declare, which become function-scoped variables.
         */
        struct FunctionScan {
            std::vector<FunctionInfo> functions;
            std::vector<VariableInfo> parameters;
            std::vector<Diagnostic> diagnostics;
        };

        FunctionScan scan_rust_functions(const lexer::TokenView& tokens, const std::string& file_path);
        FunctionScan scan_c_functions(const lexer::TokenView& tokens, Language language, const std::string& file_path);
        FunctionScan scan_assembly_functions(const lexer::TokenView& tokens, const std::string& file_path);

        std::vector<VariableInfo> scan_variables(const lexer::TokenView& tokens,
                                                 Language language,
                                                 const std::vector<FunctionInfo>& functions,
                                                 const std::string& file_path);

        std::vector<TypeInfo> scan_types(const lexer::TokenView& tokens, Language language);

        std::vector<ImportInfo> scan_imports(const lexer::TokenView& tokens, Language language);

        /**
         * Fills FunctionInfo::parent with the
         * innermost function whose body contains the signature. Functions must
         * be in position order, as the scanners produce them.
         */
        void link_parents(std::vector<FunctionInfo>& functions);

        /**
         * Innermost function whose body contains token index, if any.
         */
        std::optional<std::size_t> enclosing_function(const std::vector<FunctionInfo>& functions,
                                                      std::size_t index);

        /**
         * Splits the tokens strictly inside (open, close) on top-level commas
         * and returns [begin, end) ranges of the pieces.
         */
        std::vector<std::pair<std::size_t, std::size_t>> split_top_level(const lexer::TokenView& tokens,
                                                                          std::size_t open,
                                                                          std::size_t close);

    }  // namespace detail

}  // namespace cie::symbols

#endif //CIE_SYMBOL_EXTRACTOR_HPP
