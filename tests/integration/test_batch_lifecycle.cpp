//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/cie.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace cie::test
{
    namespace {
        std::string chain_file(const std::size_t index, const std::size_t count) {
            const std::string name = index == 0 ? "main" : "step_" + std::to_string(index);
            std::string body;
            if (index + 1 < count) {
                body = "    step_" + std::to_string(index + 1) + "();\n";
            }
            return "void " + name + "(void) {\n" + body + "}\n";
        }

        std::string chain_path(const std::size_t index) {
            return "chain/f" + std::to_string(index) + ".c";
        }
    }

    class BatchLifecycleTest : public ::testing::Test {
    protected:
        static core::Config make_config() {
            auto config = core::Config::default_config();
            config.analysis.worker_threads = 4;
            return config;
        }

        void ingest_chain(const std::size_t count) {
            for (std::size_t i = 0; i < count; ++i) {
                engine_.ingest("chain", chain_path(i), chain_file(i, count));
            }
        }

        engine::AnalysisEngine engine_{make_config()};
    };

    TEST_F(BatchLifecycleTest, LongCrossFileChain) {
        constexpr std::size_t kFiles = 40;
        ingest_chain(kFiles);

        const auto report = engine_.refresh("chain");
        ASSERT_TRUE(report.is_ok());
        EXPECT_EQ(report.value().analyzed, kFiles);
        EXPECT_TRUE(report.value().failed.empty());

        const auto graph = engine_.call_graph("chain");
        ASSERT_TRUE(graph.is_ok());
        const CallGraph& g = graph.value().data;
        EXPECT_EQ(g.nodes.size(), kFiles);
        EXPECT_EQ(g.edges.size(), kFiles - 1);
        EXPECT_TRUE(std::ranges::all_of(g.edges, &CallGraphEdge::is_cross_file));
        ASSERT_EQ(g.entry_points.size(), 1u);

        ASSERT_EQ(g.call_depth_distribution.size(), kFiles);
        for (const auto& [depth, count] : g.call_depth_distribution) {
            EXPECT_EQ(count, 1u) << "depth " << depth;
        }
    }

    TEST_F(BatchLifecycleTest, EditOneFileOfMany) {
        ingest_chain(10);
        ASSERT_TRUE(engine_.refresh("chain").is_ok());

        // Break the chain in the middle.
        engine_.ingest("chain", chain_path(5), "void step_5(void) {}\n");
        const auto report = engine_.refresh("chain");
        ASSERT_TRUE(report.is_ok());
        EXPECT_EQ(report.value().analyzed, 1u);
        EXPECT_EQ(report.value().reused, 9u);

        const auto graph = engine_.call_graph("chain");
        ASSERT_TRUE(graph.is_ok());
        const CallGraph& g = graph.value().data;
        EXPECT_EQ(g.edges.size(), 8u);

        // step_6 lost its caller and does not look like an entry point.
        EXPECT_EQ(g.entry_points.size(), 1u);
        EXPECT_EQ(g.call_depth_distribution.size(), 6u);
    }

    TEST_F(BatchLifecycleTest, DuplicateThenRecover) {
        engine_.ingest("k", "a.c", "void main(void) { helper(); }\n");
        engine_.ingest("k", "b.c", "void helper(void) {}\n");

        const auto good = engine_.call_graph("k");
        ASSERT_TRUE(good.is_ok());
        ASSERT_EQ(good.value().status, engine::ResponseStatus::Ok);
        const auto good_json = serialization::call_graph_to_json(good.value().data);

        engine_.ingest("k", "b.c", "void helper(void) {}\nvoid helper(void) {}\n");
        const auto stale = engine_.call_graph("k");
        ASSERT_TRUE(stale.is_ok());
        EXPECT_EQ(stale.value().status, engine::ResponseStatus::Stale);
        ASSERT_TRUE(stale.value().error.has_value());
        EXPECT_EQ(stale.value().error->code(), ErrorCode::DuplicateSymbol);
        EXPECT_EQ(serialization::call_graph_to_json(stale.value().data), good_json);

        // Per-file queries keep working while the corpus is stale.
        const auto file = engine_.analyze("b.c");
        ASSERT_TRUE(file.is_ok());
        EXPECT_EQ(file.value().data.functions.size(), 2u);

        engine_.ingest("k", "b.c", "void helper(void) {}\n");
        const auto recovered = engine_.call_graph("k");
        ASSERT_TRUE(recovered.is_ok());
        EXPECT_EQ(recovered.value().status, engine::ResponseStatus::Ok);
        EXPECT_FALSE(recovered.value().error.has_value());
        EXPECT_EQ(serialization::call_graph_to_json(recovered.value().data), good_json);
    }

    TEST_F(BatchLifecycleTest, MovingAFileRelinksBothCorpora) {
        engine_.ingest("left", "main.c", "void main(void) { shared(); }\n");
        engine_.ingest("left", "shared.c", "void shared(void) {}\n");

        auto left = engine_.call_graph("left");
        ASSERT_TRUE(left.is_ok());
        EXPECT_EQ(left.value().data.edges.size(), 1u);
        EXPECT_FALSE(left.value().data.nodes.back().is_extern);

        engine_.ingest("right", "shared.c", "void shared(void) {}\n");

        left = engine_.call_graph("left");
        ASSERT_TRUE(left.is_ok());
        const auto& nodes = left.value().data.nodes;
        const auto shared = std::ranges::find(nodes, "shared", &CallGraphNode::function_name);
        ASSERT_NE(shared, nodes.end());
        EXPECT_TRUE(shared->is_extern);

        const auto right = engine_.call_graph("right");
        ASSERT_TRUE(right.is_ok());
        ASSERT_EQ(right.value().data.nodes.size(), 1u);
        EXPECT_FALSE(right.value().data.nodes[0].is_extern);
    }

    TEST_F(BatchLifecycleTest, CancelledEditLeavesPublishedGraph) {
        ingest_chain(4);
        const auto before = engine_.call_graph("chain");
        ASSERT_TRUE(before.is_ok());

        engine_.ingest("chain", chain_path(1), "void step_1(void) {}\n");
        parallel::CancellationToken token;
        token.cancel();
        const auto cancelled = engine_.refresh("chain", token);
        ASSERT_TRUE(cancelled.is_err());
        EXPECT_EQ(cancelled.error().code(), ErrorCode::Cancelled);

        // The next query runs the batch that was cancelled.
        const auto after = engine_.call_graph("chain");
        ASSERT_TRUE(after.is_ok());
        EXPECT_EQ(after.value().data.edges.size(), 2u);
        EXPECT_EQ(before.value().data.edges.size(), 3u);
    }

    TEST_F(BatchLifecycleTest, ConcurrentQueriesSeeOneSnapshot) {
        ingest_chain(12);

        constexpr int kThreads = 6;
        std::vector<std::string> results(kThreads);
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([this, t, &results] {
                const auto graph = engine_.call_graph("chain");
                if (graph.is_ok()) {
                    results[t] = serialization::call_graph_to_json(graph.value().data).dump();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_FALSE(results[0].empty());
        for (const auto& result : results) {
            EXPECT_EQ(result, results[0]);
        }
    }

    TEST_F(BatchLifecycleTest, IndependentCorporaRefreshInParallel) {
        constexpr int kCorpora = 4;
        std::vector<std::thread> threads;
        std::vector<std::size_t> edge_counts(kCorpora, 0);
        for (int c = 0; c < kCorpora; ++c) {
            threads.emplace_back([this, c, &edge_counts] {
                const std::string corpus = "c" + std::to_string(c);
                const std::string prefix = corpus + "/";
                engine_.ingest(corpus, prefix + "main.c", "void main(void) { work(); work(); }\n");
                engine_.ingest(corpus, prefix + "work.c", "void work(void) {}\n");
                const auto graph = engine_.call_graph(corpus);
                if (graph.is_ok()) {
                    edge_counts[c] = graph.value().data.edges.size();
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        for (int c = 0; c < kCorpora; ++c) {
            EXPECT_EQ(edge_counts[c], 1u) << "corpus c" << c;
            EXPECT_EQ(engine_.corpus_files("c" + std::to_string(c)).size(), 2u);
        }
    }

}  // namespace cie::test
