//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_TESTS_PARSED_SOURCE_HPP
#define CIE_TESTS_PARSED_SOURCE_HPP

#include "cie/analysis/spans.hpp"
#include "cie/lexer/lexer.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/symbols/symbol_extractor.hpp"

#include <algorithm>
#include <memory>
#include <string>

namespace cie::test {

    /**
     * Source text with its tokens, symbols and token owners kept alive
     * together, the way the file pipeline holds them.
     */
    class ParsedSource {
    public:
        ParsedSource(std::string source, const Language language, std::string file_path = "test")
            : source_(std::move(source))
            , language_(language)
            , file_path_(std::move(file_path)) {
            lexed_ = lexer::tokenize(source_, language_, file_path_);
            view_ = std::make_unique<lexer::TokenView>(lexed_.tokens, source_);
            table_ = symbols::SymbolExtractor(language_, file_path_).extract(*view_);
            owners_ = analysis::function_owners(table_.functions, view_->size());
        }

        [[nodiscard]] const lexer::TokenView& tokens() const { return *view_; }
        [[nodiscard]] std::vector<FunctionInfo>& functions() { return table_.functions; }
        [[nodiscard]] const std::vector<VariableInfo>& variables() const { return table_.variables; }
        [[nodiscard]] const analysis::Owners& owners() const { return owners_; }
        [[nodiscard]] Language language() const { return language_; }
        [[nodiscard]] const std::string& file_path() const { return file_path_; }

        [[nodiscard]] std::size_t function_index(const std::string& name) const {
            const auto it = std::ranges::find(table_.functions, name, &FunctionInfo::name);
            return static_cast<std::size_t>(it - table_.functions.begin());
        }

    private:
        std::string source_;
        Language language_;
        std::string file_path_;
        lexer::LexResult lexed_;
        std::unique_ptr<lexer::TokenView> view_;
        symbols::SymbolTable table_;
        analysis::Owners owners_;
    };

}  // namespace cie::test

#endif //CIE_TESTS_PARSED_SOURCE_HPP
