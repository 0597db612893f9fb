//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/data_flow.hpp"
#include "cie/utils/string_utils.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace cie::analysis {

    namespace {
        constexpr std::size_t kSnippetLength = 40;

        bool is_compound_assignment(const std::string_view op) {
            static const std::unordered_set<std::string_view> ops = {
                "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "<<=", ">>="
            };
            return ops.contains(op);
        }

        /**
         * Variables a function can see: its own, those of enclosing
         * functions, and globals.
         */
        bool is_visible(const VariableInfo& variable,
                        const std::size_t function,
                        const std::vector<FunctionInfo>& functions) {
            if (!variable.function_index) {
                return true;
            }
            for (std::optional<std::size_t> f = function; f; f = functions[*f].parent) {
                if (*f == *variable.function_index) {
                    return true;
                }
            }
            return false;
        }

        /**
         * Text of the statement part starting at begin, up to ";", ",", a
         * closing bracket or end of line.
         */
        std::string snippet(const lexer::TokenView& tokens, const std::size_t begin, const std::size_t limit) {
            std::size_t end = begin;
            while (end < limit && tokens.valid(end)) {
                const Token& token = tokens[end];
                if (token.is_operator(";") || token.is_operator(",") || token.is_operator(")") ||
                    token.is_operator("]") || token.is_operator("}") || token.is_operator("{")) {
                    break;
                }
                if (token.is_operator("(") || token.is_operator("[")) {
                    end = tokens.matching_or_end(end);
                }
                ++end;
            }
            return string_utils::truncate(tokens.text(begin, std::min(end, limit)), kSnippetLength);
        }

        /**
         * Where a read value goes: the assignment target of the statement,
         * else the call it is an argument of, else "expression".
         */
        std::string read_destination(const lexer::TokenView& tokens, const std::size_t i, const std::size_t floor) {
            int paren_depth = 0;
            for (std::size_t j = i; j-- > floor;) {
                const Token& token = tokens[j];
                if (token.is_operator(";") || token.is_operator("{") || token.is_operator("}")) {
                    break;
                }
                if (token.is_operator(")") || token.is_operator("]")) {
                    ++paren_depth;
                } else if (token.is_operator("(") || token.is_operator("[")) {
                    if (paren_depth > 0) {
                        --paren_depth;
                    } else if (token.value == "(" && j > floor && tokens.is_identifier(j - 1)) {
                        return tokens[j - 1].value + "()";
                    }
                } else if (paren_depth == 0 && (token.is_operator("=") || is_compound_assignment(token.value)) &&
                           token.type == TokenType::Operator && j > floor) {
                    std::size_t target = j - 1;
                    if (tokens.is_operator(target, "]")) {
                        const std::size_t open = tokens.matching(target);
                        if (open != lexer::TokenView::npos && open > floor) {
                            target = open - 1;
                        }
                    }
                    return tokens[target].value;
                }
            }
            return "expression";
        }

        /**
         * True when i lies in the initializer of the Rust let binding whose
         * name token is at name. The new binding is not in scope there, so
         * "let x = x + 1" reads the outer x.
         */
        bool in_let_initializer(const lexer::TokenView& tokens, const std::size_t name, const std::size_t i) {
            std::size_t let = name;
            while (let > 0 && !tokens.is_keyword(let, "let")) {
                if (tokens.is_operator(let, ";") || tokens.is_operator(let, "{") || tokens.is_operator(let, "}")) {
                    return false;
                }
                --let;
            }
            if (!tokens.is_keyword(let, "let")) {
                return false;
            }
            // "if let" and "while let" end their expression at the block
            const bool conditional = let > 0 && (tokens.is_keyword(let - 1, "if") || tokens.is_keyword(let - 1, "while"));

            bool initializer = false;
            for (std::size_t j = name + 1; j < i; ++j) {
                const bool group = tokens.is_operator(j, "(") || tokens.is_operator(j, "[") ||
                                   (initializer && !conditional && tokens.is_operator(j, "{"));
                if (group) {
                    const std::size_t close = tokens.matching(j);
                    if (close == lexer::TokenView::npos || close > i) {
                        return initializer;
                    }
                    j = close;
                } else if (!initializer && tokens.is_operator(j, "=")) {
                    initializer = true;
                } else if (tokens.is_operator(j, ";") || tokens.is_operator(j, "{") || tokens.is_operator(j, "}")) {
                    return false;
                }
            }
            return initializer;
        }

        class FunctionTracer {
        public:
            FunctionTracer(const lexer::TokenView& tokens,
                           const std::vector<FunctionInfo>& functions,
                           const std::vector<VariableInfo>& variables,
                           const Owners& owners,
                           const Language language,
                           const std::size_t function)
                : tokens_(tokens)
                , functions_(functions)
                , variables_(variables)
                , owners_(owners)
                , language_(language)
                , function_(function) {
                for (std::size_t v = 0; v < variables_.size(); ++v) {
                    if (is_visible(variables_[v], function_, functions_)) {
                        by_name_[variables_[v].name].push_back(v);
                    }
                }
            }

            std::vector<VariableTrace> run() {
                const FunctionInfo& function = functions_[function_];
                const std::size_t end = std::min(function.body_end, tokens_.size());
                for (std::size_t i = function.signature_begin; i < end; ++i) {
                    if (i >= function.body_begin && (i >= owners_.size() || owners_[i] != function_)) {
                        continue;  // nested function body, traced on its own
                    }
                    if (!tokens_.is_identifier(i)) {
                        continue;
                    }
                    const auto variable = resolve(i);
                    if (!variable) {
                        continue;
                    }
                    record(*variable, i);
                }

                std::vector<VariableTrace> traces;
                traces.reserve(order_.size());
                for (const std::size_t v : order_) {
                    traces.push_back(std::move(traces_[v]));
                }
                return traces;
            }

        private:
            /**
             * Variable named by the identifier at i: the latest visible
             * declaration before it, preferring the declaration token itself.
             */
            std::optional<std::size_t> resolve(const std::size_t i) const {
                const auto it = by_name_.find(tokens_[i].value);
                if (it == by_name_.end()) {
                    return std::nullopt;
                }

                std::optional<std::size_t> best;
                for (const std::size_t v : it->second) {
                    const VariableInfo& variable = variables_[v];
                    if (variable.token_index == i) {
                        return v;
                    }
                    if (variable.token_index < i &&
                        (!best || variable.token_index > variables_[*best].token_index) &&
                        !(language_ == Language::Rust && in_let_initializer(tokens_, variable.token_index, i))) {
                        best = v;
                    }
                }
                if (!best && !it->second.empty() && !variables_[it->second.front()].function_index) {
                    best = it->second.front();  // global declared further down
                }
                if (best && !is_reference(i)) {
                    return std::nullopt;
                }
                return best;
            }

            /**
             * Filters out field names, path segments, calls and macro names
             * that happen to share a variable's name.
             */
            bool is_reference(const std::size_t i) const {
                if (i > 0 && (tokens_.is_operator(i - 1, ".") || tokens_.is_operator(i - 1, "->") ||
                              tokens_.is_operator(i - 1, "::"))) {
                    return false;
                }
                if (tokens_.is_operator(i + 1, "(") || tokens_.is_operator(i + 1, "!") ||
                    tokens_.is_operator(i + 1, "::")) {
                    return false;
                }
                // Rust struct literal field: "Point { x: 1 }"
                if (language_ == Language::Rust && tokens_.is_operator(i + 1, ":") && i > 0 &&
                    (tokens_.is_operator(i - 1, "{") || tokens_.is_operator(i - 1, ","))) {
                    return false;
                }
                return true;
            }

            void record(const std::size_t v, const std::size_t i) {
                const VariableInfo& variable = variables_[v];
                const Token& token = tokens_[i];

                auto [it, inserted] = traces_.try_emplace(v);
                VariableTrace& trace = it->second;
                if (inserted) {
                    trace.variable = variable.name;
                    trace.function_name = functions_[function_].name;
                    order_.push_back(v);
                    if (variable.token_index != i) {
                        trace.steps.push_back(DataFlowStep{
                            token.line,
                            DataFlowOperation::Declare,
                            variable.initialized_value.value_or(""),
                            variable.name,
                            "'" + variable.name + "' declared at line " + std::to_string(variable.line) +
                                " outside this function, first used here"
                        });
                    }
                }

                if (variable.token_index == i) {
                    trace.steps.push_back(DataFlowStep{
                        token.line,
                        DataFlowOperation::Declare,
                        variable.initialized_value.value_or(""),
                        variable.name,
                        variable.initialized_value
                            ? "Declared '" + variable.name + "' of type " + variable.var_type + " with initial value"
                            : "Declared '" + variable.name + "' of type " + variable.var_type
                    });
                    return;
                }
                trace.steps.push_back(classify(variable, i));
            }

            DataFlowStep classify(const VariableInfo& variable, const std::size_t i) const {
                const Token& token = tokens_[i];
                const std::size_t limit = std::min(functions_[function_].body_end, tokens_.size());
                DataFlowStep step;
                step.line = token.line;
                step.to = variable.name;

                const bool prefix_step = i > 0 && (tokens_.is_operator(i - 1, "++") || tokens_.is_operator(i - 1, "--"));
                const bool deref = i > 0 && tokens_.is_operator(i - 1, "*") &&
                    (i < 2 || tokens_[i - 2].type == TokenType::Operator || tokens_[i - 2].type == TokenType::Keyword) &&
                    !(i >= 2 && (tokens_.is_operator(i - 2, ")") || tokens_.is_operator(i - 2, "]")));

                std::size_t k = i + 1;
                if (tokens_.is_operator(k, "=")) {
                    step.operation = deref ? DataFlowOperation::Modify : DataFlowOperation::Write;
                    step.from = snippet(tokens_, k + 1, limit);
                    step.description = deref
                        ? "Stored a value through pointer '" + variable.name + "'"
                        : "Assigned a new value to '" + variable.name + "'";
                    return step;
                }
                if (tokens_.valid(k) && is_compound_assignment(tokens_[k].value)) {
                    step.operation = DataFlowOperation::Modify;
                    step.from = tokens_[k].value;
                    step.description = "Updated '" + variable.name + "' in place with " + tokens_[k].value;
                    return step;
                }
                if (prefix_step || tokens_.is_operator(k, "++") || tokens_.is_operator(k, "--")) {
                    step.operation = DataFlowOperation::Modify;
                    step.from = prefix_step ? tokens_[i - 1].value : tokens_[k].value;
                    step.description = "Stepped '" + variable.name + "' with " + step.from;
                    return step;
                }

                // Member or element access chain: x.a.b, x->next, x[i]
                bool through_member = false;
                while (tokens_.valid(k)) {
                    if ((tokens_.is_operator(k, ".") || tokens_.is_operator(k, "->")) && tokens_.is_identifier(k + 1)) {
                        if (tokens_.is_operator(k + 2, "(") && is_mutation_method(tokens_[k + 1].value)) {
                            step.operation = DataFlowOperation::Modify;
                            step.from = tokens_[k + 1].value + "()";
                            step.description = "Mutated '" + variable.name + "' through " + step.from;
                            return step;
                        }
                        through_member = true;
                        k += 2;
                        continue;
                    }
                    if (tokens_.is_operator(k, "[")) {
                        through_member = true;
                        k = tokens_.matching_or_end(k) + 1;
                        continue;
                    }
                    break;
                }
                if (through_member && tokens_.valid(k) &&
                    (tokens_.is_operator(k, "=") || is_compound_assignment(tokens_[k].value) ||
                     tokens_.is_operator(k, "++") || tokens_.is_operator(k, "--"))) {
                    step.operation = DataFlowOperation::Modify;
                    step.from = tokens_.text(i + 1, k + 1);
                    step.description = "Modified part of '" + variable.name + "'";
                    return step;
                }

                step.operation = DataFlowOperation::Read;
                step.from = variable.name;
                step.to = read_destination(tokens_, i, functions_[function_].signature_begin);
                step.description = "Read '" + variable.name + "' into " + step.to;
                return step;
            }

            const lexer::TokenView& tokens_;
            const std::vector<FunctionInfo>& functions_;
            const std::vector<VariableInfo>& variables_;
            const Owners& owners_;
            Language language_;
            std::size_t function_;

            std::unordered_map<std::string, std::vector<std::size_t>> by_name_;
            std::map<std::size_t, VariableTrace> traces_;
            std::vector<std::size_t> order_;
        };
    }

    bool is_mutation_method(const std::string_view name) {
        static const std::unordered_set<std::string_view> methods = {
            "push", "push_back", "push_front", "emplace_back", "insert", "remove", "pop",
            "pop_back", "pop_front", "clear", "append", "extend", "set", "store", "fetch_add",
            "fetch_sub", "swap", "truncate", "resize", "sort", "reverse", "drain", "retain",
            "erase"
        };
        return methods.contains(name);
    }

    std::vector<VariableTrace> trace_data_flow(const lexer::TokenView& tokens,
                                               const std::vector<FunctionInfo>& functions,
                                               const std::vector<VariableInfo>& variables,
                                               const Owners& owners,
                                               const Language language) {
        std::vector<VariableTrace> traces;
        for (std::size_t f = 0; f < functions.size(); ++f) {
            auto function_traces = FunctionTracer(tokens, functions, variables, owners, language, f).run();
            traces.insert(traces.end(),
                          std::make_move_iterator(function_traces.begin()),
                          std::make_move_iterator(function_traces.end()));
        }
        return traces;
    }

}  // namespace cie::analysis
