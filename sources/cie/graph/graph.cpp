//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/graph/graph.hpp"

#include <queue>
#include <ranges>

namespace cie::graph {

    // ============================================================================
    // DirectedGraph Implementation
    // ============================================================================

    void DirectedGraph::add_node(const std::string& node) {
        if (!adjacency_.contains(node)) {
            adjacency_[node] = NodeData{};
            predecessors_[node] = {};
            order_.push_back(node);
        }
    }

    void DirectedGraph::add_edge(const std::string& from, const std::string& to, const EdgeWeight weight) {
        add_node(from);
        add_node(to);

        auto& data = adjacency_[from];
        if (!data.successors.contains(to)) {
            data.successors[to] = weight;
            data.successor_order.push_back(to);
            predecessors_[to].insert(from);
            ++edge_count_;
        } else {
            data.successors[to].count += weight.count;
        }
    }

    bool DirectedGraph::has_node(const std::string& node) const {
        return adjacency_.contains(node);
    }

    bool DirectedGraph::has_edge(const std::string& from, const std::string& to) const {
        const auto it = adjacency_.find(from);
        if (it == adjacency_.end()) return false;
        return it->second.successors.contains(to);
    }

    std::vector<std::string> DirectedGraph::successors(const std::string& node) const {
        if (const auto it = adjacency_.find(node); it != adjacency_.end()) {
            return it->second.successor_order;
        }
        return {};
    }

    std::vector<std::string> DirectedGraph::predecessors(const std::string& node) const {
        std::vector<std::string> result;
        if (const auto it = predecessors_.find(node); it != predecessors_.end()) {
            result.assign(it->second.begin(), it->second.end());
        }
        return result;
    }

    std::optional<EdgeWeight> DirectedGraph::edge_weight(const std::string& from, const std::string& to) const {
        const auto it = adjacency_.find(from);
        if (it == adjacency_.end()) return std::nullopt;

        const auto edge_it = it->second.successors.find(to);
        if (edge_it == it->second.successors.end()) return std::nullopt;

        return edge_it->second;
    }

    std::size_t DirectedGraph::in_weight(const std::string& node) const {
        std::size_t total = 0;
        if (const auto it = predecessors_.find(node); it != predecessors_.end()) {
            for (const auto& pred : it->second) {
                total += adjacency_.at(pred).successors.at(node).count;
            }
        }
        return total;
    }

    std::size_t DirectedGraph::out_weight(const std::string& node) const {
        std::size_t total = 0;
        if (const auto it = adjacency_.find(node); it != adjacency_.end()) {
            for (const auto& weight : it->second.successors | std::views::values) {
                total += weight.count;
            }
        }
        return total;
    }

    std::vector<std::string> DirectedGraph::roots() const {
        std::vector<std::string> result;
        for (const auto& node : order_) {
            if (predecessors_.at(node).empty()) {
                result.push_back(node);
            }
        }
        return result;
    }

    // ============================================================================
    // Algorithms
    // ============================================================================

    std::unordered_map<std::string, std::size_t> compute_depths(const DirectedGraph& graph,
                                                                const std::vector<std::string>& sources) {
        std::unordered_map<std::string, std::size_t> depths;

        std::queue<std::string> queue;
        for (const auto& source : sources) {
            if (graph.has_node(source) && !depths.contains(source)) {
                depths[source] = 0;
                queue.push(source);
            }
        }

        while (!queue.empty()) {
            const std::string node = queue.front();
            queue.pop();

            const std::size_t depth = depths[node];
            for (const auto& succ : graph.successors(node)) {
                if (!depths.contains(succ)) {
                    depths[succ] = depth + 1;
                    queue.push(succ);
                }
            }
        }

        return depths;
    }

    std::map<std::size_t, std::size_t> depth_histogram(const std::unordered_map<std::string, std::size_t>& depths) {
        std::map<std::size_t, std::size_t> histogram;
        for (const auto depth : depths | std::views::values) {
            ++histogram[depth];
        }
        return histogram;
    }

}  // namespace cie::graph
