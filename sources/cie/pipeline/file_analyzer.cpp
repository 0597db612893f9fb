//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/pipeline/file_analyzer.hpp"
#include "cie/analysis/intra_file_analyzer.hpp"
#include "cie/analysis/spans.hpp"
#include "cie/calls/call_site_resolver.hpp"
#include "cie/lexer/lexer.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/symbols/symbol_extractor.hpp"
#include "cie/utils/hash_utils.hpp"
#include "cie/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace cie::pipeline {

    Language resolve_language(const SourceFile& source) {
        if (source.language != Language::Unknown) {
            return source.language;
        }
        return language_from_path(source.file_path);
    }

    FileAnalyzer::FileAnalyzer(const heuristics::HeuristicsConfig& config)
        : config_(config) {}

    FileArtifacts FileAnalyzer::analyze(const SourceFile& source) const {
        const Language language = resolve_language(source);

        FileArtifacts artifacts;
        artifacts.file_path = source.file_path;
        artifacts.content_hash = utils::compute_sha256(source.content);
        artifacts.lines = string_utils::split_lines(source.content);

        CodeAnalysis& analysis = artifacts.analysis;
        analysis.file_path = source.file_path;
        analysis.language = language;

        auto lexed = lexer::tokenize(source.content, language, source.file_path);
        analysis.syntax_highlighting = std::move(lexed.tokens);
        artifacts.diagnostics = std::move(lexed.diagnostics);

        const lexer::TokenView tokens(analysis.syntax_highlighting, source.content);

        const symbols::SymbolExtractor extractor(language, source.file_path);
        auto table = extractor.extract(tokens);
        analysis.functions = std::move(table.functions);
        analysis.variables = std::move(table.variables);
        analysis.types = std::move(table.types);
        analysis.imports = std::move(table.imports);
        artifacts.diagnostics.insert(artifacts.diagnostics.end(),
                                     std::make_move_iterator(table.diagnostics.begin()),
                                     std::make_move_iterator(table.diagnostics.end()));

        const auto owners = analysis::function_owners(analysis.functions, tokens.size());

        const analysis::IntraFileAnalyzer intra(language, config_);
        auto result = intra.analyze(tokens, analysis.functions, analysis.variables, owners);
        analysis.inline_explanations = std::move(result.inline_explanations);
        analysis.educational_comments = std::move(result.educational_comments);
        analysis.complexity_score = result.complexity_score;
        artifacts.data_flow = std::move(result.data_flow);
        artifacts.suggestions = std::move(result.suggestions);

        const calls::CallSiteResolver resolver(language, config_.calls);
        artifacts.call_sites = resolver.resolve(tokens, analysis.functions, owners, source.file_path);

        spdlog::debug("Analyzed {} ({}): {} tokens, {} functions, {} call sites, {} diagnostics",
                      source.file_path, to_string(language), analysis.syntax_highlighting.size(),
                      analysis.functions.size(), artifacts.call_sites.size(), artifacts.diagnostics.size());
        return artifacts;
    }

    FileArtifacts failed_artifacts(const SourceFile& source, std::string content_hash, const Error& error) {
        FileArtifacts artifacts;
        artifacts.file_path = source.file_path;
        artifacts.content_hash = std::move(content_hash);
        artifacts.analysis.file_path = source.file_path;
        artifacts.analysis.language = resolve_language(source);
        artifacts.failed = true;
        artifacts.failure_message = error.message();
        artifacts.diagnostics.push_back(Diagnostic{
            DiagnosticLevel::Error,
            error_code_to_key(error.code()),
            error.message(),
            CodeLocation{source.file_path, 0, 0}
        });
        return artifacts;
    }

}  // namespace cie::pipeline
