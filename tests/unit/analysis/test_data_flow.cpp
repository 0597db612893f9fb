//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/data_flow.hpp"
#include "helpers/parsed_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cie::analysis
{
    class DataFlowTest : public ::testing::Test {
    protected:
        std::vector<VariableTrace> trace(const std::string& source, const Language language) {
            parsed_ = std::make_unique<test::ParsedSource>(source, language);
            return trace_data_flow(parsed_->tokens(), parsed_->functions(), parsed_->variables(),
                                   parsed_->owners(), language);
        }

        static const VariableTrace* find_trace(const std::vector<VariableTrace>& traces,
                                               const std::string& variable) {
            const auto it = std::ranges::find(traces, variable, &VariableTrace::variable);
            return it == traces.end() ? nullptr : &*it;
        }

        static std::vector<DataFlowOperation> operations(const VariableTrace& trace) {
            std::vector<DataFlowOperation> ops;
            for (const auto& step : trace.steps) {
                ops.push_back(step.operation);
            }
            return ops;
        }

        std::unique_ptr<test::ParsedSource> parsed_;
    };

    TEST_F(DataFlowTest, DeclareWriteModifyRead) {
        const auto traces = trace(
            "int f(int a) {\n"
            "    int x = a;\n"
            "    x += 1;\n"
            "    x = 2;\n"
            "    return x;\n"
            "}\n",
            Language::C);

        const auto* x = find_trace(traces, "x");
        ASSERT_NE(x, nullptr);
        EXPECT_EQ(x->function_name, "f");
        EXPECT_EQ(operations(*x), (std::vector<DataFlowOperation>{
            DataFlowOperation::Declare, DataFlowOperation::Modify,
            DataFlowOperation::Write, DataFlowOperation::Read}));
        EXPECT_EQ(x->steps[0].line, 2u);
        EXPECT_EQ(x->steps[1].from, "+=");
        EXPECT_EQ(x->steps[2].from, "2");
        EXPECT_EQ(x->steps[3].line, 5u);
    }

    TEST_F(DataFlowTest, ReadIntoAssignmentTarget) {
        const auto traces = trace("int f(int a) {\n    int x = a;\n    return x;\n}\n", Language::C);

        const auto* a = find_trace(traces, "a");
        ASSERT_NE(a, nullptr);
        ASSERT_EQ(a->steps.size(), 2u);
        EXPECT_EQ(a->steps[0].operation, DataFlowOperation::Declare);
        EXPECT_EQ(a->steps[1].operation, DataFlowOperation::Read);
        EXPECT_EQ(a->steps[1].from, "a");
        EXPECT_EQ(a->steps[1].to, "x");
    }

    TEST_F(DataFlowTest, ReadIntoCallArgument) {
        const auto traces = trace("void f(int a) {\n    consume(a);\n}\n", Language::C);

        const auto* a = find_trace(traces, "a");
        ASSERT_NE(a, nullptr);
        ASSERT_EQ(a->steps.size(), 2u);
        EXPECT_EQ(a->steps[1].to, "consume()");
    }

    TEST_F(DataFlowTest, GlobalGetsSynthesizedDeclare) {
        const auto traces = trace(
            "static int counter = 0;\n"
            "void tick(void) {\n"
            "    counter++;\n"
            "}\n",
            Language::C);

        const auto* counter = find_trace(traces, "counter");
        ASSERT_NE(counter, nullptr);
        EXPECT_EQ(counter->function_name, "tick");
        ASSERT_EQ(counter->steps.size(), 2u);
        EXPECT_EQ(counter->steps[0].operation, DataFlowOperation::Declare);
        EXPECT_EQ(counter->steps[0].line, 3u);
        EXPECT_EQ(counter->steps[1].operation, DataFlowOperation::Modify);
        EXPECT_EQ(counter->steps[1].from, "++");
    }

    TEST_F(DataFlowTest, ShadowingLetReadsThePreviousBinding) {
        const auto traces = trace(
            "fn f() {\n"
            "    let x = 1;\n"
            "    let x = x + 1;\n"
            "    use_it(x);\n"
            "}\n",
            Language::Rust);

        std::vector<const VariableTrace*> xs;
        for (const auto& t : traces) {
            if (t.variable == "x") {
                xs.push_back(&t);
            }
        }
        ASSERT_EQ(xs.size(), 2u);

        ASSERT_EQ(xs[0]->steps.size(), 2u);
        EXPECT_EQ(xs[0]->steps[0].line, 2u);
        EXPECT_EQ(xs[0]->steps[1].operation, DataFlowOperation::Read);
        EXPECT_EQ(xs[0]->steps[1].line, 3u);

        ASSERT_EQ(xs[1]->steps.size(), 2u);
        EXPECT_EQ(xs[1]->steps[0].operation, DataFlowOperation::Declare);
        EXPECT_EQ(xs[1]->steps[0].line, 3u);
        EXPECT_EQ(xs[1]->steps[1].operation, DataFlowOperation::Read);
        EXPECT_EQ(xs[1]->steps[1].line, 4u);
    }

    TEST_F(DataFlowTest, MutatingMethodIsModify) {
        const auto traces = trace(
            "fn fill() {\n"
            "    let mut v = Vec::new();\n"
            "    v.push(1);\n"
            "    let n = v.len();\n"
            "}\n",
            Language::Rust);

        const auto* v = find_trace(traces, "v");
        ASSERT_NE(v, nullptr);
        EXPECT_EQ(operations(*v), (std::vector<DataFlowOperation>{
            DataFlowOperation::Declare, DataFlowOperation::Modify, DataFlowOperation::Read}));
        EXPECT_EQ(v->steps[1].from, "push()");
        EXPECT_EQ(v->steps[2].to, "n");
    }

    TEST_F(DataFlowTest, StoreThroughPointerIsModify) {
        const auto traces = trace(
            "void reset(int *p, struct dev *d) {\n"
            "    *p = 0;\n"
            "    d->state = 1;\n"
            "}\n",
            Language::C);

        const auto* p = find_trace(traces, "p");
        ASSERT_NE(p, nullptr);
        ASSERT_EQ(p->steps.size(), 2u);
        EXPECT_EQ(p->steps[1].operation, DataFlowOperation::Modify);

        const auto* d = find_trace(traces, "d");
        ASSERT_NE(d, nullptr);
        ASSERT_EQ(d->steps.size(), 2u);
        EXPECT_EQ(d->steps[1].operation, DataFlowOperation::Modify);
    }

    TEST_F(DataFlowTest, FieldNamesAreNotVariableReferences) {
        const auto traces = trace(
            "void f(int state, struct dev *d) {\n"
            "    d->state = 1;\n"
            "}\n",
            Language::C);

        const auto* state = find_trace(traces, "state");
        ASSERT_NE(state, nullptr);
        EXPECT_EQ(state->steps.size(), 1u);
    }

    TEST_F(DataFlowTest, NestedClosureIsTracedSeparately) {
        const auto traces = trace(
            "fn outer() {\n"
            "    let total = 0;\n"
            "    let add = |x| { total + x };\n"
            "}\n",
            Language::Rust);

        const auto in_closure = std::ranges::find_if(traces, [](const VariableTrace& t) {
            return t.variable == "total" && t.function_name != "outer";
        });
        ASSERT_NE(in_closure, traces.end());
        ASSERT_EQ(in_closure->steps.size(), 2u);
        EXPECT_EQ(in_closure->steps[0].operation, DataFlowOperation::Declare);
        EXPECT_EQ(in_closure->steps[1].operation, DataFlowOperation::Read);

        const auto in_outer = std::ranges::find_if(traces, [](const VariableTrace& t) {
            return t.variable == "total" && t.function_name == "outer";
        });
        ASSERT_NE(in_outer, traces.end());
        EXPECT_EQ(in_outer->steps.size(), 1u);
    }

    TEST_F(DataFlowTest, EveryTraceStartsWithDeclare) {
        const auto traces = trace(
            "static mut TICKS: u64 = 0;\n"
            "fn tick(step: u64) -> u64 {\n"
            "    let mut next = step;\n"
            "    next += 1;\n"
            "    unsafe { TICKS = next; }\n"
            "    for i in 0..3 { next = next + i; }\n"
            "    next\n"
            "}\n",
            Language::Rust);

        ASSERT_FALSE(traces.empty());
        for (const auto& t : traces) {
            ASSERT_FALSE(t.steps.empty()) << t.variable;
            EXPECT_EQ(t.steps.front().operation, DataFlowOperation::Declare) << t.variable;
        }
    }

    TEST_F(DataFlowTest, MutationMethodNames) {
        EXPECT_TRUE(is_mutation_method("push"));
        EXPECT_TRUE(is_mutation_method("fetch_add"));
        EXPECT_TRUE(is_mutation_method("clear"));
        EXPECT_FALSE(is_mutation_method("len"));
        EXPECT_FALSE(is_mutation_method("get"));
    }

}  // namespace cie::analysis
