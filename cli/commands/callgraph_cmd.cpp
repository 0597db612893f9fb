//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cli/commands/command.hpp"
#include "cie/serialization/json_serializer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace cie::cli
{
    /**
     * Callgraph command - links every file and prints the global call graph.
     */
    class CallGraphCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "callgraph";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Build the cross-file call graph of a source tree";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cie callgraph [OPTIONS] <paths...>\n"
                   "\n"
                   "Examples:\n"
                   "  cie callgraph kernel/\n"
                   "  cie callgraph --edges src/main.c src/irq.c\n"
                   "  cie callgraph --json kernel/ > graph.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"edges", 'e', "List every edge", false, false, "", ""},
                {"top", 't', "Number of most-called functions to show (0=all)", false, true, "10", "N"},
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
            if (auto files = ingest_inputs(engine, corpus_id, args); files.is_err()) {
                print_error(files.error().to_string());
                return 1;
            }

            auto graph = engine.call_graph(corpus_id);
            if (graph.is_err()) {
                print_error(graph.error().to_string());
                return 1;
            }
            const auto& response = graph.value();

            if (is_json()) {
                std::cout << serialization::response_to_json(
                    response, serialization::call_graph_to_json(response.data)).dump(2) << "\n";
            } else {
                print_response_header(response);
                print_graph(response.data, args);
            }

            return response.status == engine::ResponseStatus::Stale ? 1 : 0;
        }

    private:
        static constexpr const char* corpus_id = "cli";

        void print_graph(const CallGraph& graph, const ParsedArgs& args) const {
            std::ostringstream summary;
            summary << "Call graph: " << graph.nodes.size() << " nodes, " << graph.edges.size()
                    << " edges, complexity score " << graph.complexity_score;
            print(summary.str());

            std::unordered_map<std::string, const CallGraphNode*> by_id;
            for (const auto& node : graph.nodes) {
                by_id[node.id] = &node;
            }
            auto label = [&](const std::string& id) -> std::string {
                const auto it = by_id.find(id);
                return it == by_id.end() ? id : it->second->function_name;
            };

            if (!graph.entry_points.empty()) {
                print("\nEntry points:");
                for (const auto& id : graph.entry_points) {
                    print("  " + label(id));
                }
            }

            std::vector<const CallGraphNode*> ranked;
            ranked.reserve(graph.nodes.size());
            for (const auto& node : graph.nodes) {
                ranked.push_back(&node);
            }
            std::ranges::stable_sort(ranked, [](const auto* a, const auto* b) {
                return a->call_count > b->call_count;
            });

            const auto top = static_cast<std::size_t>(std::max(0, args.get_int("top").value_or(10)));
            if (top != 0 && ranked.size() > top) {
                ranked.resize(top);
            }

            print("\nFunctions:");
            for (const auto* node : ranked) {
                std::ostringstream ss;
                ss << "  " << std::left << std::setw(32) << node->function_name
                   << " calls in " << std::setw(4) << node->call_count
                   << " impact " << std::setw(8) << to_string(node->performance_impact);
                if (node->is_extern) {
                    ss << " (extern)";
                } else if (node->file_path) {
                    ss << " " << *node->file_path << ":" << node->line_number.value_or(0);
                }
                print(ss.str());
            }

            if (args.get_flag("edges")) {
                print("\nEdges:");
                for (const auto& edge : graph.edges) {
                    std::ostringstream ss;
                    ss << "  " << label(edge.from) << " -> " << label(edge.to) << " x" << edge.call_count;
                    if (edge.is_recursive) ss << " [recursive]";
                    if (edge.is_cross_file) ss << " [cross-file]";
                    if (edge.is_system_call) ss << " [system call]";
                    print(ss.str());
                }
            }

            if (is_verbose() && !graph.call_depth_distribution.empty()) {
                print("\nCall depth distribution:");
                for (const auto& [depth, count] : graph.call_depth_distribution) {
                    print("  depth " + std::to_string(depth) + ": " + std::to_string(count));
                }
            }
        }
    };

    namespace {
        struct CallGraphCommandRegistrar {
            CallGraphCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CallGraphCommand>()
                );
            }
        } callgraph_registrar;
    }
}  // namespace cie::cli
