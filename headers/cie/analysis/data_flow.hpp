//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_ANALYSIS_DATA_FLOW_HPP
#define CIE_ANALYSIS_DATA_FLOW_HPP

/**
 * @file data_flow.hpp
 * @brief Per-function variable event traces.
 *
 * Every sighting of a known variable inside a function becomes one step:
 * - declare: the declaration token itself
 * - write:   assignment target of a plain "="
 * - modify:  compound assignment, ++/--, a mutating method call, or an
 *            assignment through a field, index or dereference
 * - read:    anything else
 *
 * A variable declared outside the function (global or enclosing scope)
 * gets a synthesized declare step at its first sighting, so every trace
 * starts with declare.
 */

#include "cie/analysis/spans.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/types.hpp"

#include <vector>

namespace cie::analysis {

    /**
     * Traces ordered by function, then by the variable's first sighting.
     */
    std::vector<VariableTrace> trace_data_flow(const lexer::TokenView& tokens,
                                               const std::vector<FunctionInfo>& functions,
                                               const std::vector<VariableInfo>& variables,
                                               const Owners& owners,
                                               Language language);

    /**
     * True for method names that mutate their receiver (push, insert,
     * clear, fetch_add, ...).
     */
    [[nodiscard]] bool is_mutation_method(std::string_view name);

}  // namespace cie::analysis

#endif //CIE_ANALYSIS_DATA_FLOW_HPP
