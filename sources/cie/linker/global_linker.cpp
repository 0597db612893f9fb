//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/linker/global_linker.hpp"
#include "cie/calls/call_site_resolver.hpp"
#include "cie/graph/graph.hpp"
#include "cie/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <unordered_set>

namespace cie::linker {

    namespace {
        struct EdgeFlags {
            bool is_cross_file = false;
            bool is_system_call = false;
        };

        std::optional<std::size_t> find_in_file(const FileArtifacts& file,
                                                const std::string& name,
                                                const bool unqualified) {
            const auto& functions = file.analysis.functions;
            const std::string_view wanted = calls::simple_name(name);
            for (std::size_t i = 0; i < functions.size(); ++i) {
                const bool match = unqualified
                    ? calls::simple_name(functions[i].name) == wanted
                    : functions[i].name == name || calls::strip_generics(functions[i].name) == name;
                if (match) {
                    return i;
                }
            }
            return std::nullopt;
        }

        std::string registry_key(const std::string& file_path, const std::string& function_name) {
            return file_path + ":" + function_name;
        }
    }

    LinkContext LinkContext::from(std::vector<std::shared_ptr<const FileArtifacts>> artifacts) {
        std::ranges::stable_sort(artifacts, [](const auto& a, const auto& b) {
            return a->file_path < b->file_path;
        });
        return LinkContext{std::move(artifacts)};
    }

    const FileArtifacts* LinkContext::find(const std::string& file_path) const {
        const auto it = std::ranges::find_if(files, [&](const auto& file) {
            return file->file_path == file_path;
        });
        return it == files.end() ? nullptr : it->get();
    }

    std::string function_node_id(const std::string& file_path, const std::string& function_name) {
        std::uint64_t hash = utils::fnv1a_hash(file_path);
        hash = utils::fnv1a_hash(hash, std::string_view("\0", 1));
        hash = utils::fnv1a_hash(hash, function_name);
        return "fn_" + utils::to_hex_string(hash);
    }

    std::string extern_node_id(const std::string& callee) {
        return "ext_" + utils::to_hex_string(utils::fnv1a_hash(callee));
    }

    std::optional<DefinitionRef> find_definition(const LinkContext& context,
                                                 const std::string& name,
                                                 const std::string& from_file) {
        std::optional<std::size_t> home;
        for (std::size_t f = 0; f < context.files.size(); ++f) {
            if (context.files[f]->file_path == from_file) {
                home = f;
                break;
            }
        }

        for (const bool unqualified : {false, true}) {
            if (home) {
                if (const auto index = find_in_file(*context.files[*home], name, unqualified)) {
                    return DefinitionRef{*home, *index};
                }
            }
        }
        for (const bool unqualified : {false, true}) {
            for (std::size_t f = 0; f < context.files.size(); ++f) {
                if (home && f == *home) {
                    continue;
                }
                if (const auto index = find_in_file(*context.files[f], name, unqualified)) {
                    return DefinitionRef{f, *index};
                }
            }
        }
        return std::nullopt;
    }

    GlobalLinker::GlobalLinker(const heuristics::HeuristicsConfig& config)
        : config_(config) {}

    Result<LinkedProgram, Error> GlobalLinker::link(const LinkContext& context) const {
        std::vector<std::regex> entry_patterns;
        for (const auto& pattern : config_.linker.entry_point_patterns) {
            try {
                entry_patterns.emplace_back(pattern);
            } catch (const std::regex_error& e) {
                return Result<LinkedProgram, Error>::failure(
                    Error::config_error("Invalid entry point pattern: " + std::string(e.what()), pattern)
                );
            }
        }

        LinkedProgram program;
        graph::DirectedGraph graph;
        std::unordered_map<std::string, CallGraphNode> nodes;

        // Union phase
        for (std::size_t f = 0; f < context.files.size(); ++f) {
            const FileArtifacts& file = *context.files[f];
            for (std::size_t i = 0; i < file.analysis.functions.size(); ++i) {
                const FunctionInfo& function = file.analysis.functions[i];
                const std::string id = function_node_id(file.file_path, function.name);
                if (program.definitions.contains(id)) {
                    const std::string key = registry_key(file.file_path, function.name);
                    spdlog::error("Link aborted: duplicate function {}", key);
                    return Result<LinkedProgram, Error>::failure(
                        Error::duplicate_symbol("Function defined twice in the same file", key)
                    );
                }
                program.definitions.emplace(id, DefinitionRef{f, i});

                CallGraphNode node;
                node.id = id;
                node.function_name = function.name;
                node.file_path = file.file_path;
                node.line_number = function.start_line;
                node.complexity = function.complexity;
                nodes.emplace(id, std::move(node));
                graph.add_node(id);
            }
        }
        spdlog::debug("Linker registry holds {} functions from {} files",
                      program.definitions.size(), context.files.size());

        // Resolution phase
        std::unordered_map<std::string, std::unordered_map<std::string, EdgeFlags>> flags;
        for (std::size_t f = 0; f < context.files.size(); ++f) {
            const FileArtifacts& file = *context.files[f];
            for (const CallSite& site : file.call_sites) {
                if (site.caller_index >= file.analysis.functions.size()) {
                    continue;
                }

                ResolvedCall call;
                call.site = site;
                call.from = function_node_id(file.file_path, file.analysis.functions[site.caller_index].name);

                if (site.kind == CallKind::Recursive) {
                    call.target = DefinitionRef{f, site.caller_index};
                } else {
                    call.target = find_definition(context, site.callee, file.file_path);
                    if (call.target && call.target->file == f && call.target->function == site.caller_index) {
                        call.target.reset();  // only recursive sites close a self-loop
                    }
                }

                if (call.target) {
                    const FileArtifacts& target_file = *context.files[call.target->file];
                    call.to = function_node_id(target_file.file_path,
                                               target_file.analysis.functions[call.target->function].name);
                } else {
                    call.to = extern_node_id(site.callee);
                    if (!nodes.contains(call.to)) {
                        CallGraphNode node;
                        node.id = call.to;
                        node.function_name = site.callee;
                        node.is_extern = true;
                        nodes.emplace(call.to, std::move(node));
                    }
                }

                graph.add_edge(call.from, call.to);
                EdgeFlags& edge = flags[call.from][call.to];
                edge.is_cross_file = call.target.has_value() && call.target->file != f;
                edge.is_system_call = edge.is_system_call || site.kind == CallKind::SystemCall;
                program.calls.push_back(std::move(call));
            }
        }

        // Nodes, in registry order followed by externs in first-seen order
        std::unordered_set<std::string> system_call_nodes;
        for (const auto& [from, targets] : flags) {
            for (const auto& [to, edge] : targets) {
                if (edge.is_system_call) {
                    system_call_nodes.insert(from);
                    system_call_nodes.insert(to);
                }
            }
        }

        CallGraph& result = program.graph;
        for (const auto& id : graph.nodes()) {
            CallGraphNode node = nodes.at(id);
            node.call_count = graph.in_weight(id);

            if (!node.is_extern && graph.predecessors(id).empty()) {
                const std::string simple(calls::simple_name(node.function_name));
                node.is_entry_point = std::ranges::any_of(entry_patterns, [&](const std::regex& pattern) {
                    return std::regex_match(simple, pattern);
                });
            }

            const auto& bands = config_.complexity;
            if (system_call_nodes.contains(id) || node.complexity > bands.high_threshold) {
                node.performance_impact = Severity::Critical;
            } else if (node.complexity > bands.medium_threshold ||
                       graph.out_weight(id) > config_.linker.large_call_count) {
                node.performance_impact = Severity::High;
            } else {
                node.performance_impact = Severity::Medium;
            }

            if (node.is_entry_point) {
                result.entry_points.push_back(id);
            }
            if (!node.is_extern) {
                result.complexity_score += node.complexity;
            }
            result.nodes.push_back(std::move(node));
        }

        for (const auto& from : graph.nodes()) {
            for (const auto& to : graph.successors(from)) {
                const EdgeFlags& edge = flags.at(from).at(to);
                result.edges.push_back(CallGraphEdge{
                    from,
                    to,
                    graph.edge_weight(from, to)->count,
                    from == to,
                    edge.is_cross_file,
                    edge.is_system_call
                });
            }
        }

        result.call_depth_distribution = graph::depth_histogram(graph::compute_depths(graph, result.entry_points));

        spdlog::debug("Linked {} nodes, {} edges, {} entry points",
                      result.nodes.size(), result.edges.size(), result.entry_points.size());
        return Result<LinkedProgram, Error>::success(std::move(program));
    }

}  // namespace cie::linker
