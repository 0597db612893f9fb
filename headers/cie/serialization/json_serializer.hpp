//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_JSON_SERIALIZER_HPP
#define CIE_JSON_SERIALIZER_HPP

/**
 * @file json_serializer.hpp
 * @brief Builders for the JSON contract consumed by the rendering layer.
 *
 * Field names and nesting are part of the contract and must not change.
 * Enums serialize as snake_case strings, absent optionals as null.
 */

#include "cie/engine/response.hpp"
#include "cie/error.hpp"
#include "cie/types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace cie::serialization {

    using json = nlohmann::json;

    json location_to_json(const CodeLocation& location);
    json token_to_json(const Token& token);
    json function_to_json(const FunctionInfo& function);
    json variable_to_json(const VariableInfo& variable);
    json type_to_json(const TypeInfo& type);
    json import_to_json(const ImportInfo& import);
    json explanation_to_json(const InlineExplanation& explanation);
    json comment_to_json(const EducationalComment& comment);
    json analysis_to_json(const CodeAnalysis& analysis);

    json node_to_json(const CallGraphNode& node);
    json edge_to_json(const CallGraphEdge& edge);
    json call_graph_to_json(const CallGraph& graph);

    json hotspot_to_json(const PerformanceHotspot& hotspot);
    json optimization_to_json(const OptimizationSuggestion& suggestion);

    json trace_to_json(const VariableTrace& trace);
    json suggestion_to_json(const CodeSuggestion& suggestion);
    json search_result_to_json(const SearchResult& result);
    json navigation_to_json(const NavigationLocation& location);

    json diagnostic_to_json(const Diagnostic& diagnostic);
    json error_to_json(const Error& error);
    json batch_report_to_json(const engine::BatchReport& report);

    /**
     * Serializes a payload element by element into an array.
     */
    template<typename T, typename F>
    json array_to_json(const std::vector<T>& items, F&& to_json) {
        json array = json::array();
        for (const auto& item : items) {
            array.push_back(to_json(item));
        }
        return array;
    }

    /**
     * Wraps a payload in the {"status", "data", "diagnostics", "error"?}
     * envelope.
     */
    template<typename T>
    json response_to_json(const engine::Response<T>& response, const json& data) {
        json envelope;
        envelope["status"] = engine::to_string(response.status);
        envelope["data"] = data;
        envelope["diagnostics"] = array_to_json(response.diagnostics, diagnostic_to_json);
        if (response.error) {
            envelope["error"] = error_to_json(*response.error);
        }
        return envelope;
    }

}  // namespace cie::serialization

#endif //CIE_JSON_SERIALIZER_HPP
