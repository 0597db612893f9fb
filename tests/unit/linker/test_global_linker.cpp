//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/linker/global_linker.hpp"
#include "cie/pipeline/file_analyzer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cie::linker
{
    class GlobalLinkerTest : public ::testing::Test {
    protected:
        void add_file(const std::string& path, const std::string& content) {
            const pipeline::FileAnalyzer analyzer(config_);
            files_.push_back(std::make_shared<const FileArtifacts>(analyzer.analyze({path, content})));
        }

        Result<LinkedProgram, Error> link() {
            return GlobalLinker(config_).link(LinkContext::from(files_));
        }

        static const CallGraphNode* node_named(const CallGraph& graph, const std::string& name) {
            const auto it = std::ranges::find(graph.nodes, name, &CallGraphNode::function_name);
            return it == graph.nodes.end() ? nullptr : &*it;
        }

        heuristics::HeuristicsConfig config_ = heuristics::HeuristicsConfig::defaults();
        std::vector<std::shared_ptr<const FileArtifacts>> files_;
    };

    TEST_F(GlobalLinkerTest, NodeIdsAreStable) {
        EXPECT_EQ(function_node_id("a.c", "main"), function_node_id("a.c", "main"));
        EXPECT_NE(function_node_id("a.c", "main"), function_node_id("b.c", "main"));
        EXPECT_NE(function_node_id("a.c", "main"), extern_node_id("main"));
        EXPECT_TRUE(function_node_id("a.c", "main").starts_with("fn_"));
        EXPECT_TRUE(extern_node_id("printf").starts_with("ext_"));
    }

    TEST_F(GlobalLinkerTest, ContextIsOrderedByPath) {
        add_file("src/z.rs", "fn z() {}\n");
        add_file("src/a.rs", "fn a() {}\n");

        const auto context = LinkContext::from(files_);
        ASSERT_EQ(context.files.size(), 2u);
        EXPECT_EQ(context.files[0]->file_path, "src/a.rs");
        EXPECT_NE(context.find("src/z.rs"), nullptr);
        EXPECT_EQ(context.find("src/missing.rs"), nullptr);
    }

    TEST_F(GlobalLinkerTest, CrossFileMutualRecursion) {
        add_file("src/ping.rs", "fn ping(n: u32) {\n    pong(n);\n}\n");
        add_file("src/pong.rs", "fn pong(n: u32) {\n    ping(n);\n}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const CallGraph& graph = result.value().graph;

        ASSERT_EQ(graph.nodes.size(), 2u);
        ASSERT_EQ(graph.edges.size(), 2u);
        for (const auto& edge : graph.edges) {
            EXPECT_TRUE(edge.is_cross_file);
            EXPECT_FALSE(edge.is_recursive);
            EXPECT_FALSE(edge.is_system_call);
            EXPECT_EQ(edge.call_count, 1u);
        }
        for (const auto& node : graph.nodes) {
            EXPECT_FALSE(node.is_extern);
            EXPECT_FALSE(node.is_entry_point);
            EXPECT_EQ(node.call_count, 1u);
        }
        EXPECT_TRUE(graph.entry_points.empty());
    }

    TEST_F(GlobalLinkerTest, SelfRecursionIsOneSelfLoop) {
        add_file("math.c",
                 "int fact(int n) {\n"
                 "    if (n <= 1) { return 1; }\n"
                 "    return n * fact(n - 1);\n"
                 "}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;

        ASSERT_EQ(graph.nodes.size(), 1u);
        ASSERT_EQ(graph.edges.size(), 1u);
        EXPECT_EQ(graph.edges[0].from, graph.edges[0].to);
        EXPECT_TRUE(graph.edges[0].is_recursive);
        EXPECT_FALSE(graph.edges[0].is_cross_file);
        EXPECT_EQ(graph.nodes[0].complexity, 3);
    }

    TEST_F(GlobalLinkerTest, SameNamedMethodOnFieldIsNotASelfLoop) {
        add_file("src/stack.rs",
                 "impl Stack {\n"
                 "    fn len(&self) -> usize {\n"
                 "        self.items.len()\n"
                 "    }\n"
                 "}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const CallGraph& graph = result.value().graph;
        ASSERT_EQ(graph.edges.size(), 1u);
        EXPECT_FALSE(graph.edges[0].is_recursive);
        EXPECT_EQ(graph.edges[0].to, extern_node_id("len"));
    }

    TEST_F(GlobalLinkerTest, UnresolvedCalleesBecomeExternNodes) {
        add_file("main.c",
                 "int main(void) {\n"
                 "    printf(\"a\");\n"
                 "    printf(\"b\");\n"
                 "    return 0;\n"
                 "}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;

        const auto* printf_node = node_named(graph, "printf");
        ASSERT_NE(printf_node, nullptr);
        EXPECT_TRUE(printf_node->is_extern);
        EXPECT_FALSE(printf_node->file_path.has_value());
        EXPECT_FALSE(printf_node->line_number.has_value());
        EXPECT_EQ(printf_node->call_count, 2u);
        EXPECT_EQ(printf_node->id, extern_node_id("printf"));

        ASSERT_EQ(graph.edges.size(), 1u);
        EXPECT_EQ(graph.edges[0].call_count, 2u);
        EXPECT_FALSE(graph.edges[0].is_cross_file);
    }

    TEST_F(GlobalLinkerTest, EveryEdgeEndpointIsANode) {
        add_file("a.c", "void a(void) { b(); c(); }\n");
        add_file("b.c", "void b(void) { c(); missing(); }\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;
        for (const auto& edge : graph.edges) {
            EXPECT_NE(graph.find_node(edge.from), nullptr);
            EXPECT_NE(graph.find_node(edge.to), nullptr);
        }
    }

    TEST_F(GlobalLinkerTest, CallingFileIsSearchedFirst) {
        add_file("a.c", "static void helper(void) {}\nvoid run(void) { helper(); }\n");
        add_file("b.c", "void helper(void) {}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const auto& calls = result.value().calls;
        ASSERT_EQ(calls.size(), 1u);
        EXPECT_EQ(calls[0].to, function_node_id("a.c", "helper"));
        EXPECT_FALSE(result.value().graph.edges[0].is_cross_file);
    }

    TEST_F(GlobalLinkerTest, QualifiedCallResolvesByUnqualifiedName) {
        add_file("src/sched.rs", "impl Scheduler {\n    fn tick(&mut self) {}\n}\n");
        add_file("src/main.rs", "fn main() {\n    sched::tick();\n}\n");

        const auto context = LinkContext::from(files_);
        const auto definition = find_definition(context, "sched::tick", "src/main.rs");
        ASSERT_TRUE(definition.has_value());
        EXPECT_EQ(context.files[definition->file]->file_path, "src/sched.rs");
    }

    TEST_F(GlobalLinkerTest, SystemCallEdgesAreCritical) {
        add_file("irq.c",
                 "static int setup(void) {\n"
                 "    request_irq(IRQ_TIMER, timer_isr, 0, \"timer\", NULL);\n"
                 "    return 0;\n"
                 "}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;

        ASSERT_EQ(graph.edges.size(), 1u);
        EXPECT_TRUE(graph.edges[0].is_system_call);
        const auto* setup = node_named(graph, "setup");
        ASSERT_NE(setup, nullptr);
        EXPECT_EQ(setup->performance_impact, Severity::Critical);
    }

    TEST_F(GlobalLinkerTest, EntryPointsAndDepths) {
        add_file("kernel.c",
                 "void helper(void) {}\n"
                 "void kernel_main(void) { helper(); }\n"
                 "void unused_routine(void) {}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;

        ASSERT_EQ(graph.entry_points.size(), 1u);
        EXPECT_EQ(graph.entry_points[0], function_node_id("kernel.c", "kernel_main"));
        EXPECT_TRUE(node_named(graph, "kernel_main")->is_entry_point);
        EXPECT_FALSE(node_named(graph, "unused_routine")->is_entry_point);
        EXPECT_EQ(graph.call_depth_distribution,
                  (std::map<std::size_t, std::size_t>{{0, 1}, {1, 1}}));
        EXPECT_EQ(graph.complexity_score, 3);
    }

    TEST_F(GlobalLinkerTest, ConfiguredEntryPointPatterns) {
        config_.linker.entry_point_patterns = {"^boot_.*"};
        add_file("boot.c", "void boot_cpu(void) {}\nvoid main(void) {}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        const CallGraph& graph = result.value().graph;
        ASSERT_EQ(graph.entry_points.size(), 1u);
        EXPECT_EQ(graph.entry_points[0], function_node_id("boot.c", "boot_cpu"));
    }

    TEST_F(GlobalLinkerTest, InvalidEntryPatternIsConfigError) {
        config_.linker.entry_point_patterns = {"(unclosed"};
        add_file("a.c", "void a(void) {}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(GlobalLinkerTest, DuplicateKeyAbortsLink) {
        add_file("dup.c", "int f(void) { return 0; }\nint f(void) { return 1; }\n");

        const auto result = link();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::DuplicateSymbol);
        EXPECT_EQ(result.error().context().value_or(""), "dup.c:f");
    }

    TEST_F(GlobalLinkerTest, ImplsOfOneGenericTraitAreDistinct) {
        add_file("src/err.rs",
                 "enum E { Io, Parse }\n"
                 "impl From<std::io::Error> for E {\n"
                 "    fn from(e: std::io::Error) -> Self { E::Io }\n"
                 "}\n"
                 "impl From<std::num::ParseIntError> for E {\n"
                 "    fn from(e: std::num::ParseIntError) -> Self { E::Parse }\n"
                 "}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const CallGraph& graph = result.value().graph;
        ASSERT_EQ(graph.nodes.size(), 2u);
        EXPECT_NE(node_named(graph, "<E as From<std::io::Error>>::from"), nullptr);
        EXPECT_NE(node_named(graph, "<E as From<std::num::ParseIntError>>::from"), nullptr);
        EXPECT_NE(graph.nodes[0].id, graph.nodes[1].id);
    }

    TEST_F(GlobalLinkerTest, GenericTypePathFindsItsImpl) {
        add_file("src/buf.rs",
                 "struct Buf<T> { v: Vec<T> }\n"
                 "impl<T> Buf<T> {\n"
                 "    fn new() -> Self { Buf { v: Vec::new() } }\n"
                 "}\n");

        const auto context = LinkContext::from(files_);
        const auto definition = find_definition(context, "Buf::new", "src/main.rs");
        ASSERT_TRUE(definition.has_value());
        EXPECT_EQ(context.files[definition->file]->analysis.functions[definition->function].name, "Buf<T>::new");
    }

    TEST_F(GlobalLinkerTest, SameNameInDifferentFilesIsFine) {
        add_file("a.c", "static void init(void) {}\n");
        add_file("b.c", "static void init(void) {}\n");

        const auto result = link();
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().graph.nodes.size(), 2u);
    }

    TEST_F(GlobalLinkerTest, LinkingIsDeterministic) {
        add_file("b.c", "void b(void) { a(); x(); }\n");
        add_file("a.c", "void a(void) { b(); y(); }\n");

        const auto first = link();
        std::ranges::reverse(files_);
        const auto second = link();
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(second.is_ok());

        const auto ids = [](const CallGraph& graph) {
            std::vector<std::string> out;
            for (const auto& node : graph.nodes) out.push_back(node.id);
            for (const auto& edge : graph.edges) out.push_back(edge.from + "->" + edge.to);
            return out;
        };
        EXPECT_EQ(ids(first.value().graph), ids(second.value().graph));
    }

}  // namespace cie::linker
