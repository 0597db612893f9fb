//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/symbols/symbol_extractor.hpp"
#include "scan_support.hpp"

#include <algorithm>

namespace cie::symbols::detail {

    namespace {
        /**
         * "name:" at the start of a line. Local labels (".Lfoo:", "1:") lex
         * as directives or numbers and never match.
         */
        bool is_label(const lexer::TokenView& tokens, const std::size_t i) {
            return tokens.is_identifier(i) && tokens.is_operator(i + 1, ":") &&
                   (i == 0 || tokens[i - 1].line < tokens[i].line);
        }
    }

    FunctionScan scan_assembly_functions(const lexer::TokenView& tokens, const std::string& file_path) {
        FunctionScan scan;

        std::vector<std::size_t> labels;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (is_label(tokens, i)) {
                labels.push_back(i);
            }
        }

        for (std::size_t n = 0; n < labels.size(); ++n) {
            const std::size_t label = labels[n];
            const std::size_t next = n + 1 < labels.size() ? labels[n + 1] : tokens.size();

            FunctionInfo function;
            function.name = tokens[label].value;
            function.signature = function.name + ":";
            function.location = location_of(tokens, label, file_path);
            function.signature_begin = label;
            function.body_begin = label + 1;
            function.body_end = next;
            function.start_line = tokens[label].line;
            function.end_line = std::max(function.start_line, tokens[next - 1].line);
            scan.functions.push_back(std::move(function));
        }
        return scan;
    }

}  // namespace cie::symbols::detail
