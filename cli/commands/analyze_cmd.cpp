//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cli/commands/command.hpp"
#include "cie/serialization/json_serializer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace cie::cli
{
    using nlohmann::json;

    /**
     * Analyze command - per-file structure, complexity and suggestions.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Extract functions, variables, types and complexity from source files";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cie analyze [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  cie analyze src/main.rs\n"
                   "  cie analyze --suggestions --data-flow kernel/\n"
                   "  cie analyze --json --config cie.toml drivers/";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"suggestions", 's', "Include code suggestions", false, false, "", ""},
                {"data-flow", 'd', "Include variable traces", false, false, "", ""},
                {"variable", 0, "Restrict variable traces to one name", false, true, "", "NAME"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }
            apply_common_flags(args);

            auto config = load_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            engine::AnalysisEngine engine(config.value());
            auto files = ingest_inputs(engine, corpus_id, args);
            if (files.is_err()) {
                print_error(files.error().to_string());
                return 1;
            }

            const bool with_suggestions = args.get_flag("suggestions");
            const bool with_data_flow = args.get_flag("data-flow") || args.has("variable");
            const auto variable = args.get("variable");

            json output = json::array();
            bool any_failed = false;

            for (const auto& file : files.value()) {
                auto analysis = engine.analyze(file);
                if (analysis.is_err()) {
                    print_error(analysis.error().to_string());
                    return 1;
                }
                const auto& response = analysis.value();
                any_failed = any_failed || response.status == engine::ResponseStatus::Failed;

                json entry;
                entry["file_path"] = file;
                entry["analysis"] = serialization::response_to_json(
                    response, serialization::analysis_to_json(response.data));

                if (!is_json()) {
                    print_analysis(file, response);
                }

                if (with_suggestions) {
                    auto suggestions = engine.suggestions(file);
                    if (suggestions.is_err()) {
                        print_error(suggestions.error().to_string());
                        return 1;
                    }
                    entry["suggestions"] = serialization::response_to_json(
                        suggestions.value(),
                        serialization::array_to_json(suggestions.value().data, serialization::suggestion_to_json));
                    if (!is_json()) {
                        print_suggestions(suggestions.value().data);
                    }
                }

                if (with_data_flow) {
                    auto traces = engine.data_flow(file, variable);
                    if (traces.is_err()) {
                        print_error(traces.error().to_string());
                        return 1;
                    }
                    entry["data_flow"] = serialization::response_to_json(
                        traces.value(),
                        serialization::array_to_json(traces.value().data, serialization::trace_to_json));
                    if (!is_json()) {
                        print_traces(traces.value().data);
                    }
                }

                output.push_back(std::move(entry));
            }

            if (is_json()) {
                std::cout << output.dump(2) << "\n";
            }
            return any_failed ? 1 : 0;
        }

    private:
        static constexpr const char* corpus_id = "cli";

        void print_analysis(const std::string& file, const engine::Response<CodeAnalysis>& response) const {
            const auto& analysis = response.data;
            print(file + " (" + to_string(analysis.language) + ", " + engine::to_string(response.status) + ")");
            print_response_header(response);

            if (response.status == engine::ResponseStatus::Failed) {
                return;
            }

            std::ostringstream ss;
            ss << "  complexity score: " << analysis.complexity_score << "\n";
            ss << "  functions: " << analysis.functions.size()
               << ", variables: " << analysis.variables.size()
               << ", types: " << analysis.types.size()
               << ", imports: " << analysis.imports.size();
            print(ss.str());

            for (const auto& function : analysis.functions) {
                std::ostringstream line;
                line << "    " << std::left << std::setw(32) << function.name
                     << " lines " << function.start_line << "-" << function.end_line
                     << "  complexity " << function.complexity;
                print(line.str());
            }

            if (is_verbose()) {
                for (const auto& explanation : analysis.inline_explanations) {
                    print("    line " + std::to_string(explanation.line) + ": " + explanation.explanation);
                }
            }
        }

        void print_suggestions(const std::vector<CodeSuggestion>& suggestions) const {
            if (suggestions.empty()) {
                return;
            }
            print("  suggestions:");
            for (const auto& suggestion : suggestions) {
                std::ostringstream ss;
                ss << "    " << suggestion.line << ":" << suggestion.column << " ["
                   << to_string(suggestion.severity) << "] " << suggestion.message;
                if (suggestion.fix_suggestion) {
                    ss << " (fix: " << *suggestion.fix_suggestion << ")";
                }
                print(ss.str());
            }
        }

        void print_traces(const std::vector<VariableTrace>& traces) const {
            for (const auto& trace : traces) {
                print("  " + trace.variable + " in " + trace.function_name);
                for (const auto& step : trace.steps) {
                    print("    line " + std::to_string(step.line) + " " + to_string(step.operation) +
                          ": " + step.description);
                }
            }
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace cie::cli
