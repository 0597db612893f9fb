//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/graph/graph.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cie::graph
{
    class DirectedGraphTest : public ::testing::Test {
    protected:
        DirectedGraph graph_;
    };

    TEST_F(DirectedGraphTest, EmptyGraph) {
        EXPECT_EQ(graph_.node_count(), 0u);
        EXPECT_EQ(graph_.edge_count(), 0u);
        EXPECT_TRUE(graph_.nodes().empty());
        EXPECT_TRUE(graph_.roots().empty());
    }

    TEST_F(DirectedGraphTest, AddNodeIsIdempotent) {
        graph_.add_node("a.c::main");
        graph_.add_node("a.c::main");

        EXPECT_EQ(graph_.node_count(), 1u);
        EXPECT_TRUE(graph_.has_node("a.c::main"));
        EXPECT_FALSE(graph_.has_node("b.c::main"));
    }

    TEST_F(DirectedGraphTest, AddEdgeCreatesEndpoints) {
        graph_.add_edge("A", "B");

        EXPECT_EQ(graph_.node_count(), 2u);
        EXPECT_EQ(graph_.edge_count(), 1u);
        EXPECT_TRUE(graph_.has_edge("A", "B"));
        EXPECT_FALSE(graph_.has_edge("B", "A"));
    }

    TEST_F(DirectedGraphTest, RepeatedEdgeAccumulatesWeight) {
        graph_.add_edge("A", "B");
        graph_.add_edge("A", "B");
        graph_.add_edge("A", "B", EdgeWeight{3});

        EXPECT_EQ(graph_.edge_count(), 1u);
        ASSERT_TRUE(graph_.edge_weight("A", "B").has_value());
        EXPECT_EQ(graph_.edge_weight("A", "B")->count, 5u);
        EXPECT_FALSE(graph_.edge_weight("B", "A").has_value());
        EXPECT_EQ(graph_.out_weight("A"), 5u);
        EXPECT_EQ(graph_.in_weight("B"), 5u);
    }

    TEST_F(DirectedGraphTest, SelfLoopIsOneEdge) {
        graph_.add_edge("fact", "fact");
        graph_.add_edge("fact", "fact");

        EXPECT_EQ(graph_.node_count(), 1u);
        EXPECT_EQ(graph_.edge_count(), 1u);
        EXPECT_EQ(graph_.successors("fact"), std::vector<std::string>{"fact"});
        EXPECT_EQ(graph_.predecessors("fact"), std::vector<std::string>{"fact"});
        EXPECT_TRUE(graph_.roots().empty());
    }

    TEST_F(DirectedGraphTest, SuccessorsKeepInsertionOrder) {
        graph_.add_edge("A", "C");
        graph_.add_edge("A", "B");
        graph_.add_edge("A", "C");

        EXPECT_EQ(graph_.successors("A"), (std::vector<std::string>{"C", "B"}));
        EXPECT_TRUE(graph_.successors("B").empty());
        EXPECT_TRUE(graph_.successors("missing").empty());
    }

    TEST_F(DirectedGraphTest, Predecessors) {
        graph_.add_edge("A", "C");
        graph_.add_edge("B", "C");

        auto preds = graph_.predecessors("C");
        std::ranges::sort(preds);
        EXPECT_EQ(preds, (std::vector<std::string>{"A", "B"}));
        EXPECT_TRUE(graph_.predecessors("A").empty());
    }

    TEST_F(DirectedGraphTest, NodesInInsertionOrder) {
        graph_.add_node("z");
        graph_.add_edge("m", "a");

        EXPECT_EQ(graph_.nodes(), (std::vector<std::string>{"z", "m", "a"}));
    }

    TEST_F(DirectedGraphTest, RootsHaveNoIncomingEdges) {
        graph_.add_edge("main", "init");
        graph_.add_edge("init", "setup");
        graph_.add_node("orphan");

        EXPECT_EQ(graph_.roots(), (std::vector<std::string>{"main", "orphan"}));
    }

    TEST_F(DirectedGraphTest, MutualRecursionHasNoRoots) {
        graph_.add_edge("a", "b");
        graph_.add_edge("b", "a");

        EXPECT_EQ(graph_.edge_count(), 2u);
        EXPECT_TRUE(graph_.roots().empty());
    }

    // ============================================================================
    // Depths
    // ============================================================================

    TEST_F(DirectedGraphTest, DepthsFromSources) {
        graph_.add_edge("main", "init");
        graph_.add_edge("main", "run");
        graph_.add_edge("run", "tick");
        graph_.add_edge("init", "tick");
        graph_.add_node("unreachable");

        const auto depths = compute_depths(graph_, {"main"});

        EXPECT_EQ(depths.at("main"), 0u);
        EXPECT_EQ(depths.at("init"), 1u);
        EXPECT_EQ(depths.at("run"), 1u);
        EXPECT_EQ(depths.at("tick"), 2u);
        EXPECT_FALSE(depths.contains("unreachable"));

        const auto histogram = depth_histogram(depths);
        EXPECT_EQ(histogram, (std::map<std::size_t, std::size_t>{{0, 1}, {1, 2}, {2, 1}}));
    }

    TEST_F(DirectedGraphTest, DepthsTerminateOnCycles) {
        graph_.add_edge("a", "b");
        graph_.add_edge("b", "c");
        graph_.add_edge("c", "a");

        const auto depths = compute_depths(graph_, {"a"});
        EXPECT_EQ(depths.size(), 3u);
        EXPECT_EQ(depths.at("c"), 2u);
    }

    TEST_F(DirectedGraphTest, UnknownSourcesAreIgnored) {
        graph_.add_edge("a", "b");

        const auto depths = compute_depths(graph_, {"missing", "b"});
        EXPECT_EQ(depths.size(), 1u);
        EXPECT_EQ(depths.at("b"), 0u);
        EXPECT_TRUE(depth_histogram({}).empty());
    }

}  // namespace cie::graph
