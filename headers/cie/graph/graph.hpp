//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_GRAPH_HPP
#define CIE_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Directed call multigraph keyed by opaque node ids.
 *
 * Nodes and edges live in flat maps indexed by id, so cycles (recursion,
 * mutual recursion across files) need no special ownership handling.
 * Iteration follows insertion order, which keeps every derived output
 * reproducible for unchanged input.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cie::graph {

    /**
     * Multiplicity of an edge: how many call sites it coalesces.
     */
    struct EdgeWeight {
        std::size_t count = 1;
    };

    /**
     * Directed graph with weighted edges.
     *
     * Uses adjacency list representation for efficient traversal.
     * Thread-safe for read operations after construction.
     */
    class DirectedGraph {
    public:
        DirectedGraph() = default;

        /**
         * Adds a node to the graph. Adding an existing node is a no-op.
         */
        void add_node(const std::string& node);

        /**
         * Adds a directed edge, creating missing endpoints. A repeated edge
         * accumulates its weight.
         */
        void add_edge(const std::string& from, const std::string& to, EdgeWeight weight = {});

        [[nodiscard]] bool has_node(const std::string& node) const;

        [[nodiscard]] bool has_edge(const std::string& from, const std::string& to) const;

        /**
         * Returns all nodes in insertion order.
         */
        [[nodiscard]] const std::vector<std::string>& nodes() const noexcept {
            return order_;
        }

        [[nodiscard]] std::size_t node_count() const noexcept {
            return order_.size();
        }

        [[nodiscard]] std::size_t edge_count() const noexcept {
            return edge_count_;
        }

        /**
         * Successors in the order their first edge was added.
         */
        [[nodiscard]] std::vector<std::string> successors(const std::string& node) const;

        [[nodiscard]] std::vector<std::string> predecessors(const std::string& node) const;

        [[nodiscard]] std::optional<EdgeWeight> edge_weight(const std::string& from, const std::string& to) const;

        /**
         * Sum of the weights of incoming edges.
         */
        [[nodiscard]] std::size_t in_weight(const std::string& node) const;

        /**
         * Sum of the weights of outgoing edges.
         */
        [[nodiscard]] std::size_t out_weight(const std::string& node) const;

        /**
         * Returns nodes with no incoming edges.
         */
        [[nodiscard]] std::vector<std::string> roots() const;

    private:
        struct NodeData {
            std::vector<std::string> successor_order;
            std::unordered_map<std::string, EdgeWeight> successors;
        };

        std::vector<std::string> order_;
        std::unordered_map<std::string, NodeData> adjacency_;
        std::unordered_map<std::string, std::unordered_set<std::string>> predecessors_;
        std::size_t edge_count_ = 0;
    };

    /**
     * Breadth-first distance of every node reachable from sources. Sources
     * are at depth 0; unreachable nodes are absent from the result.
     */
    [[nodiscard]] std::unordered_map<std::string, std::size_t> compute_depths(
        const DirectedGraph& graph,
        const std::vector<std::string>& sources
    );

    /**
     * Number of nodes at each depth.
     */
    [[nodiscard]] std::map<std::size_t, std::size_t> depth_histogram(
        const std::unordered_map<std::string, std::size_t>& depths
    );

}  // namespace cie::graph

#endif //CIE_GRAPH_HPP
