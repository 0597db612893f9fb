//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/engine/analysis_engine.hpp"
#include "cie/utils/string_utils.hpp"

#include <algorithm>
#include <set>

namespace cie::engine {

    namespace {
        constexpr std::size_t kMatchTextLimit = 80;

        std::string line_text(const FileArtifacts& file, const std::size_t line) {
            if (line == 0 || line > file.lines.size()) {
                return "";
            }
            return std::string(string_utils::trim(file.lines[line - 1]));
        }

        void search_file(const FileArtifacts& file, const std::string& query, std::vector<SearchResult>& results) {
            std::vector<SearchResult> found;
            const auto add = [&](const std::size_t line, std::string match, const SearchResultType type) {
                found.push_back(SearchResult{file.file_path, line, std::move(match), line_text(file, line), type});
            };

            const CodeAnalysis& analysis = file.analysis;
            for (const auto& function : analysis.functions) {
                if (string_utils::icontains(function.name, query)) {
                    add(function.start_line, function.name, SearchResultType::Function);
                }
            }
            for (const auto& variable : analysis.variables) {
                if (string_utils::icontains(variable.name, query)) {
                    add(variable.line, variable.name, SearchResultType::Variable);
                }
            }
            for (const auto& type : analysis.types) {
                if (string_utils::icontains(type.name, query)) {
                    add(type.line, type.name, SearchResultType::Type);
                }
            }
            for (const auto& token : analysis.syntax_highlighting) {
                if (token.type != TokenType::Comment && token.type != TokenType::String) {
                    continue;
                }
                if (string_utils::icontains(token.value, query)) {
                    add(token.line, string_utils::truncate(token.value, kMatchTextLimit),
                        token.type == TokenType::Comment ? SearchResultType::Comment : SearchResultType::String);
                }
            }

            std::ranges::stable_sort(found, [](const SearchResult& a, const SearchResult& b) {
                return a.line < b.line;
            });
            results.insert(results.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
        }

        std::optional<std::size_t> find_type(const FileArtifacts& file, const std::string& name) {
            const auto& types = file.analysis.types;
            for (std::size_t i = 0; i < types.size(); ++i) {
                if (types[i].name == name) {
                    return i;
                }
            }
            return std::nullopt;
        }
    }

    Result<Response<std::vector<SearchResult>>, Error> AnalysisEngine::search(const std::string& corpus_id,
                                                                              const std::string& query) {
        using SearchResponse = Response<std::vector<SearchResult>>;

        if (query.empty()) {
            return Result<SearchResponse, Error>::failure(Error::invalid_argument("Search query is empty"));
        }
        if (auto view = ensure_fresh(corpus_id); view.is_err()) {
            return Result<SearchResponse, Error>::failure(view.error());
        }

        SearchResponse response;
        for (const auto& path : corpus_files(corpus_id)) {
            auto cached = cache_.lookup(path);
            if (cached.is_err()) {
                return Result<SearchResponse, Error>::failure(cached.error());
            }
            if (!cached.value()) {
                continue;
            }
            if (cached.value()->failed) {
                response.diagnostics.push_back(cached.value()->diagnostics.front());
                continue;
            }
            search_file(*cached.value(), query, response.data);
        }
        response.status = response.data.empty() ? ResponseStatus::Empty : ResponseStatus::Ok;
        return Result<SearchResponse, Error>::success(std::move(response));
    }

    Result<Response<NavigationLocation>, Error> AnalysisEngine::navigate(const std::string& file_path,
                                                                         const std::string& symbol) {
        using NavigationResponse = Response<NavigationLocation>;

        auto artifacts = artifacts_for(file_path);
        if (artifacts.is_err()) {
            return Result<NavigationResponse, Error>::failure(artifacts.error());
        }
        const std::string corpus_id = *corpus_of(file_path);
        auto view = ensure_fresh(corpus_id);
        if (view.is_err()) {
            return Result<NavigationResponse, Error>::failure(view.error());
        }

        std::vector<std::shared_ptr<const FileArtifacts>> files;
        for (const auto& path : corpus_files(corpus_id)) {
            auto cached = cache_.lookup(path);
            if (cached.is_err()) {
                return Result<NavigationResponse, Error>::failure(cached.error());
            }
            if (cached.value()) {
                files.push_back(cached.value());
            }
        }
        const auto context = linker::LinkContext::from(std::move(files));
        const FileArtifacts& home = *artifacts.value();

        NavigationResponse response;
        NavigationLocation& location = response.data;

        if (const auto definition = linker::find_definition(context, symbol, file_path)) {
            const FileArtifacts& target = *context.files[definition->file];
            const FunctionInfo& function = target.analysis.functions[definition->function];
            location.file_path = target.file_path;
            location.line = function.start_line;
            location.column = function.location.column;
            location.symbol_type = SearchResultType::Function;

            const std::string id = linker::function_node_id(target.file_path, function.name);
            if (const auto& snapshot = view.value().snapshot) {
                for (const auto& call : snapshot->program.calls) {
                    if (call.to != id) {
                        continue;
                    }
                    const FileArtifacts* caller = snapshot->context.find(call.site.location.file_path);
                    location.references.push_back(ReferenceInfo{
                        call.site.location.file_path,
                        call.site.location.line,
                        caller ? line_text(*caller, call.site.location.line) : ""
                    });
                }
            }
        } else if (const auto variable = std::ranges::find(home.analysis.variables, symbol, &VariableInfo::name);
                   variable != home.analysis.variables.end()) {
            location.file_path = home.file_path;
            location.line = variable->line;
            location.column = variable->location.column;
            location.symbol_type = SearchResultType::Variable;

            std::set<std::size_t> lines;
            for (const auto& trace : home.data_flow) {
                if (trace.variable != symbol) {
                    continue;
                }
                for (const auto& step : trace.steps) {
                    if (step.line != variable->line) {
                        lines.insert(step.line);
                    }
                }
            }
            for (const auto line : lines) {
                location.references.push_back(ReferenceInfo{home.file_path, line, line_text(home, line)});
            }
        } else {
            const FileArtifacts* owner = find_type(home, symbol) ? &home : nullptr;
            for (std::size_t f = 0; !owner && f < context.files.size(); ++f) {
                if (find_type(*context.files[f], symbol)) {
                    owner = context.files[f].get();
                }
            }
            if (!owner) {
                return Result<NavigationResponse, Error>::failure(Error::not_found("Unknown symbol", symbol));
            }

            const TypeInfo& type = owner->analysis.types[*find_type(*owner, symbol)];
            location.file_path = owner->file_path;
            location.line = type.line;
            location.symbol_type = SearchResultType::Type;
            for (const auto& token : owner->analysis.syntax_highlighting) {
                if (token.line == type.line && token.value == symbol) {
                    location.column = token.start_col;
                    break;
                }
            }

            for (const auto& file : context.files) {
                std::set<std::size_t> lines;
                for (const auto& token : file->analysis.syntax_highlighting) {
                    if (token.type != TokenType::Identifier || token.value != symbol) {
                        continue;
                    }
                    if (file.get() == owner && token.line == type.line) {
                        continue;
                    }
                    lines.insert(token.line);
                }
                for (const auto line : lines) {
                    location.references.push_back(ReferenceInfo{file->file_path, line, line_text(*file, line)});
                }
            }
        }

        if (view.value().link_error) {
            response.status = ResponseStatus::Stale;
            response.error = view.value().link_error;
        }
        return Result<NavigationResponse, Error>::success(std::move(response));
    }

}  // namespace cie::engine
