//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/intra_file_analyzer.hpp"
#include "cie/analysis/annotations.hpp"
#include "cie/analysis/complexity.hpp"
#include "cie/analysis/data_flow.hpp"
#include "cie/analysis/knowledge.hpp"

namespace cie::analysis {

    IntraFileAnalyzer::IntraFileAnalyzer(const Language language, const heuristics::HeuristicsConfig& config)
        : language_(language)
        , config_(config) {}

    IntraFileResult IntraFileAnalyzer::analyze(const lexer::TokenView& tokens,
                                               std::vector<FunctionInfo>& functions,
                                               const std::vector<VariableInfo>& variables,
                                               const Owners& owners) const {
        IntraFileResult result;

        const auto complexity = compute_complexity(tokens, functions, owners, language_);
        for (std::size_t f = 0; f < functions.size(); ++f) {
            functions[f].complexity = complexity[f];
            functions[f].educational_description = function_description(functions[f].simple_name());
            result.complexity_score += complexity[f];
        }

        result.data_flow = trace_data_flow(tokens, functions, variables, owners, language_);
        result.inline_explanations = inline_explanations(tokens, language_, config_.calls);
        result.educational_comments = educational_comments(tokens, language_, functions, variables, result.data_flow);
        result.suggestions = code_suggestions(tokens, language_, functions, loop_depths(tokens, language_),
                                              config_.complexity);
        return result;
    }

}  // namespace cie::analysis
