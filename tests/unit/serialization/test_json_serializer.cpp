//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/serialization/json_serializer.hpp"

#include <gtest/gtest.h>

namespace cie::serialization
{
    TEST(JsonSerializerTest, FunctionFields) {
        FunctionInfo function;
        function.name = "Scheduler::tick";
        function.signature = "fn tick(&mut self)";
        function.start_line = 3;
        function.end_line = 9;
        function.parameters = {"&mut self"};
        function.return_type = "()";
        function.complexity = 4;

        const json j = function_to_json(function);
        EXPECT_EQ(j["name"], "Scheduler::tick");
        EXPECT_EQ(j["start_line"], 3);
        EXPECT_EQ(j["end_line"], 9);
        EXPECT_EQ(j["parameters"], json::array({"&mut self"}));
        EXPECT_EQ(j["return_type"], "()");
        EXPECT_EQ(j["complexity"], 4);
        EXPECT_TRUE(j["educational_description"].is_null());
        EXPECT_FALSE(j.contains("body_begin"));
    }

    TEST(JsonSerializerTest, TokenUsesSnakeCaseType) {
        Token token;
        token.type = TokenType::Keyword;
        token.value = "fn";
        token.line = 1;
        token.start_col = 0;
        token.end_col = 2;

        const json j = token_to_json(token);
        EXPECT_EQ(j["token_type"], "keyword");
        EXPECT_EQ(j["token_value"], "fn");
        EXPECT_EQ(j["end_col"], 2);
    }

    TEST(JsonSerializerTest, VariableScopeAndOptionalValue) {
        VariableInfo variable;
        variable.name = "count";
        variable.var_type = "u32";
        variable.line = 2;
        variable.scope = VariableScope::Block;
        variable.is_mutable = true;
        variable.initialized_value = "0";

        const json j = variable_to_json(variable);
        EXPECT_EQ(j["scope"], "block");
        EXPECT_EQ(j["is_mutable"], true);
        EXPECT_EQ(j["initialized_value"], "0");
    }

    TEST(JsonSerializerTest, ExternNodeHasNullLocation) {
        CallGraphNode node;
        node.id = "ext_1";
        node.function_name = "printf";
        node.is_extern = true;
        node.call_count = 2;
        node.performance_impact = Severity::Critical;

        const json j = node_to_json(node);
        EXPECT_TRUE(j["file_path"].is_null());
        EXPECT_TRUE(j["line_number"].is_null());
        EXPECT_EQ(j["is_extern"], true);
        EXPECT_EQ(j["call_count"], 2);
        EXPECT_EQ(j["performance_impact"], "critical");
    }

    TEST(JsonSerializerTest, CallGraphShape) {
        CallGraph graph;
        graph.nodes.push_back(CallGraphNode{"fn_a", "a", "a.c", 1, 1, false, true, 0, Severity::Medium});
        graph.edges.push_back(CallGraphEdge{"fn_a", "fn_a", 1, true, false, false});
        graph.entry_points = {"fn_a"};
        graph.complexity_score = 1;
        graph.call_depth_distribution = {{0, 1}};

        const json j = call_graph_to_json(graph);
        ASSERT_EQ(j["nodes"].size(), 1u);
        EXPECT_EQ(j["nodes"][0]["file_path"], "a.c");
        EXPECT_EQ(j["edges"][0]["is_recursive"], true);
        EXPECT_EQ(j["entry_points"], json::array({"fn_a"}));
        EXPECT_EQ(j["call_depth_distribution"]["0"], 1);
    }

    TEST(JsonSerializerTest, HotspotNestsLocation) {
        PerformanceHotspot hotspot;
        hotspot.location = CodeLocation{"irq.c", 2, 4};
        hotspot.hotspot_type = HotspotType::SystemCall;
        hotspot.severity = Severity::Critical;
        hotspot.optimization_potential = Severity::High;

        const json j = hotspot_to_json(hotspot);
        EXPECT_EQ(j["location"]["file_path"], "irq.c");
        EXPECT_EQ(j["location"]["line"], 2);
        EXPECT_EQ(j["location"]["column"], 4);
        EXPECT_EQ(j["hotspot_type"], "system_call");
        EXPECT_EQ(j["severity"], "critical");
        EXPECT_EQ(j["optimization_potential"], "high");
        EXPECT_FALSE(j.contains("rule"));
    }

    TEST(JsonSerializerTest, TraceSteps) {
        VariableTrace trace;
        trace.variable = "x";
        trace.function_name = "main";
        trace.steps.push_back(DataFlowStep{1, DataFlowOperation::Declare, "1", "x", "Declared"});
        trace.steps.push_back(DataFlowStep{2, DataFlowOperation::Modify, "+=", "x", "Updated"});

        const json j = trace_to_json(trace);
        ASSERT_EQ(j["steps"].size(), 2u);
        EXPECT_EQ(j["steps"][0]["operation"], "declare");
        EXPECT_EQ(j["steps"][1]["operation"], "modify");
        EXPECT_EQ(j["steps"][1]["from"], "+=");
    }

    TEST(JsonSerializerTest, NavigationReferences) {
        NavigationLocation location;
        location.file_path = "a.rs";
        location.line = 4;
        location.column = 3;
        location.symbol_type = SearchResultType::Type;
        location.references.push_back(ReferenceInfo{"b.rs", 7, "let s = Stack::new();"});

        const json j = navigation_to_json(location);
        EXPECT_EQ(j["symbol_type"], "type");
        ASSERT_EQ(j["references"].size(), 1u);
        EXPECT_EQ(j["references"][0]["line"], 7);
    }

    TEST(JsonSerializerTest, ErrorUsesSnakeCaseCode) {
        const json j = error_to_json(Error::duplicate_symbol("Function defined twice", "a.c:f"));
        EXPECT_EQ(j["code"], "duplicate_symbol");
        EXPECT_EQ(j["context"], "a.c:f");

        const json plain = error_to_json(Error::cancelled("stop"));
        EXPECT_TRUE(plain["context"].is_null());
    }

    TEST(JsonSerializerTest, ResponseEnvelope) {
        engine::Response<std::vector<FunctionInfo>> response;
        response.status = engine::ResponseStatus::Stale;
        response.error = Error::duplicate_symbol("dup", "a.c:f");
        response.diagnostics.push_back(
            Diagnostic{DiagnosticLevel::Warning, "syntax.unclosed-body", "Body never closed", CodeLocation{"a.c", 3, 0}});

        const json j = response_to_json(response, array_to_json(response.data, function_to_json));
        EXPECT_EQ(j["status"], "stale");
        EXPECT_TRUE(j["data"].is_array());
        EXPECT_EQ(j["diagnostics"][0]["level"], "warning");
        EXPECT_EQ(j["diagnostics"][0]["code"], "syntax.unclosed-body");
        EXPECT_EQ(j["error"]["code"], "duplicate_symbol");
    }

    TEST(JsonSerializerTest, OkResponseHasNoErrorField) {
        engine::Response<int> response;
        const json j = response_to_json(response, json(5));
        EXPECT_EQ(j["status"], "ok");
        EXPECT_EQ(j["data"], 5);
        EXPECT_FALSE(j.contains("error"));
    }

    TEST(JsonSerializerTest, BatchReport) {
        engine::BatchReport report;
        report.analyzed = 3;
        report.reused = 1;
        report.failed.push_back(engine::FailedFile{"bad.c", Error::analysis_error("boom", "bad.c")});

        const json j = batch_report_to_json(report);
        EXPECT_EQ(j["analyzed"], 3);
        EXPECT_EQ(j["reused"], 1);
        EXPECT_EQ(j["failed"][0]["file_path"], "bad.c");
        EXPECT_EQ(j["failed"][0]["error"]["code"], "analysis_error");
        EXPECT_FALSE(j.contains("link_error"));
    }

}  // namespace cie::serialization
