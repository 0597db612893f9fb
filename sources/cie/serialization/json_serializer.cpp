//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/serialization/json_serializer.hpp"

namespace cie::serialization {

    namespace {
        template<typename T>
        json optional_to_json(const std::optional<T>& value) {
            return value ? json(*value) : json(nullptr);
        }
    }

    json location_to_json(const CodeLocation& location) {
        json j;
        j["file_path"] = location.file_path;
        j["line"] = location.line;
        j["column"] = location.column;
        return j;
    }

    json token_to_json(const Token& token) {
        json j;
        j["line"] = token.line;
        j["start_col"] = token.start_col;
        j["end_col"] = token.end_col;
        j["token_type"] = to_string(token.type);
        j["token_value"] = token.value;
        return j;
    }

    json function_to_json(const FunctionInfo& function) {
        json j;
        j["name"] = function.name;
        j["signature"] = function.signature;
        j["start_line"] = function.start_line;
        j["end_line"] = function.end_line;
        j["parameters"] = function.parameters;
        j["return_type"] = function.return_type;
        j["complexity"] = function.complexity;
        j["educational_description"] = optional_to_json(function.educational_description);
        return j;
    }

    json variable_to_json(const VariableInfo& variable) {
        json j;
        j["name"] = variable.name;
        j["var_type"] = variable.var_type;
        j["line"] = variable.line;
        j["scope"] = to_string(variable.scope);
        j["is_mutable"] = variable.is_mutable;
        j["initialized_value"] = optional_to_json(variable.initialized_value);
        return j;
    }

    json type_to_json(const TypeInfo& type) {
        json fields = json::array();
        for (const auto& field : type.fields) {
            fields.push_back({
                {"name", field.name},
                {"field_type", field.field_type},
                {"is_public", field.is_public}
            });
        }

        json j;
        j["name"] = type.name;
        j["definition"] = type.definition;
        j["line"] = type.line;
        j["fields"] = std::move(fields);
        j["is_builtin"] = type.is_builtin;
        return j;
    }

    json import_to_json(const ImportInfo& import) {
        json j;
        j["module"] = import.module;
        j["items"] = import.items;
        j["is_external"] = import.is_external;
        j["line"] = import.line;
        return j;
    }

    json explanation_to_json(const InlineExplanation& explanation) {
        json j;
        j["line"] = explanation.line;
        j["start_col"] = explanation.start_col;
        j["end_col"] = explanation.end_col;
        j["explanation"] = explanation.explanation;
        j["complexity_level"] = to_string(explanation.complexity_level);
        j["related_concepts"] = explanation.related_concepts;
        return j;
    }

    json comment_to_json(const EducationalComment& comment) {
        json j;
        j["line"] = comment.line;
        j["comment"] = comment.comment;
        j["category"] = to_string(comment.category);
        j["difficulty_level"] = to_string(comment.difficulty_level);
        j["learning_objectives"] = comment.learning_objectives;
        return j;
    }

    json analysis_to_json(const CodeAnalysis& analysis) {
        json j;
        j["syntax_highlighting"] = array_to_json(analysis.syntax_highlighting, token_to_json);
        j["functions"] = array_to_json(analysis.functions, function_to_json);
        j["variables"] = array_to_json(analysis.variables, variable_to_json);
        j["types"] = array_to_json(analysis.types, type_to_json);
        j["imports"] = array_to_json(analysis.imports, import_to_json);
        j["inline_explanations"] = array_to_json(analysis.inline_explanations, explanation_to_json);
        j["complexity_score"] = analysis.complexity_score;
        j["educational_comments"] = array_to_json(analysis.educational_comments, comment_to_json);
        return j;
    }

    json node_to_json(const CallGraphNode& node) {
        json j;
        j["id"] = node.id;
        j["function_name"] = node.function_name;
        j["file_path"] = optional_to_json(node.file_path);
        j["line_number"] = optional_to_json(node.line_number);
        j["complexity"] = node.complexity;
        j["is_extern"] = node.is_extern;
        j["is_entry_point"] = node.is_entry_point;
        j["call_count"] = node.call_count;
        j["performance_impact"] = to_string(node.performance_impact);
        return j;
    }

    json edge_to_json(const CallGraphEdge& edge) {
        json j;
        j["from"] = edge.from;
        j["to"] = edge.to;
        j["call_count"] = edge.call_count;
        j["is_recursive"] = edge.is_recursive;
        j["is_cross_file"] = edge.is_cross_file;
        j["is_system_call"] = edge.is_system_call;
        return j;
    }

    json call_graph_to_json(const CallGraph& graph) {
        json distribution = json::object();
        for (const auto& [depth, count] : graph.call_depth_distribution) {
            distribution[std::to_string(depth)] = count;
        }

        json j;
        j["nodes"] = array_to_json(graph.nodes, node_to_json);
        j["edges"] = array_to_json(graph.edges, edge_to_json);
        j["entry_points"] = graph.entry_points;
        j["complexity_score"] = graph.complexity_score;
        j["call_depth_distribution"] = std::move(distribution);
        return j;
    }

    json hotspot_to_json(const PerformanceHotspot& hotspot) {
        json j;
        j["location"] = location_to_json(hotspot.location);
        j["hotspot_type"] = to_string(hotspot.hotspot_type);
        j["severity"] = to_string(hotspot.severity);
        j["estimated_impact"] = to_string(hotspot.estimated_impact);
        j["description"] = hotspot.description;
        j["educational_context"] = hotspot.educational_context;
        j["optimization_potential"] = to_string(hotspot.optimization_potential);
        return j;
    }

    json optimization_to_json(const OptimizationSuggestion& suggestion) {
        json j;
        j["location"] = location_to_json(suggestion.location);
        j["suggestion_type"] = suggestion.suggestion_type;
        j["priority"] = to_string(suggestion.priority);
        j["description"] = suggestion.description;
        j["implementation_effort"] = suggestion.implementation_effort;
        j["expected_improvement"] = suggestion.expected_improvement;
        j["code_example"] = suggestion.code_example;
        j["educational_explanation"] = suggestion.educational_explanation;
        j["related_concepts"] = suggestion.related_concepts;
        return j;
    }

    json trace_to_json(const VariableTrace& trace) {
        json steps = json::array();
        for (const auto& step : trace.steps) {
            steps.push_back({
                {"line", step.line},
                {"operation", to_string(step.operation)},
                {"from", step.from},
                {"to", step.to},
                {"description", step.description}
            });
        }

        json j;
        j["variable"] = trace.variable;
        j["function_name"] = trace.function_name;
        j["steps"] = std::move(steps);
        return j;
    }

    json suggestion_to_json(const CodeSuggestion& suggestion) {
        json j;
        j["line"] = suggestion.line;
        j["column"] = suggestion.column;
        j["suggestion_type"] = suggestion.suggestion_type;
        j["message"] = suggestion.message;
        j["severity"] = to_string(suggestion.severity);
        j["fix_suggestion"] = optional_to_json(suggestion.fix_suggestion);
        return j;
    }

    json search_result_to_json(const SearchResult& result) {
        json j;
        j["file_path"] = result.file_path;
        j["line"] = result.line;
        j["match_text"] = result.match_text;
        j["context"] = result.context;
        j["result_type"] = to_string(result.result_type);
        return j;
    }

    json navigation_to_json(const NavigationLocation& location) {
        json references = json::array();
        for (const auto& reference : location.references) {
            references.push_back({
                {"file_path", reference.file_path},
                {"line", reference.line},
                {"context", reference.context}
            });
        }

        json j;
        j["file_path"] = location.file_path;
        j["line"] = location.line;
        j["column"] = location.column;
        j["symbol_type"] = to_string(location.symbol_type);
        j["references"] = std::move(references);
        return j;
    }

    json diagnostic_to_json(const Diagnostic& diagnostic) {
        json j;
        j["level"] = to_string(diagnostic.level);
        j["code"] = diagnostic.code;
        j["message"] = diagnostic.message;
        j["location"] = location_to_json(diagnostic.location);
        return j;
    }

    json error_to_json(const Error& error) {
        json j;
        j["code"] = error_code_to_key(error.code());
        j["message"] = error.message();
        j["context"] = optional_to_json(error.context());
        return j;
    }

    json batch_report_to_json(const engine::BatchReport& report) {
        json failed = json::array();
        for (const auto& file : report.failed) {
            failed.push_back({
                {"file_path", file.file_path},
                {"error", error_to_json(file.error)}
            });
        }

        json j;
        j["analyzed"] = report.analyzed;
        j["reused"] = report.reused;
        j["failed"] = std::move(failed);
        if (report.link_error) {
            j["link_error"] = error_to_json(*report.link_error);
        }
        return j;
    }

}  // namespace cie::serialization
