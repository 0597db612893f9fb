//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/engine/analysis_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cie::engine
{
    class NavigationTest : public ::testing::Test {
    protected:
        void SetUp() override {
            engine_.ingest("k", "src/stack.rs",
                           "// Stack used by the scheduler\n"
                           "pub struct Stack {\n"
                           "    items: Vec<u8>,\n"
                           "}\n"
                           "impl Stack {\n"
                           "    pub fn push(&mut self, v: u8) {\n"
                           "        self.items.insert(0, v);\n"
                           "    }\n"
                           "}\n");
            engine_.ingest("k", "src/main.rs",
                           "fn main() {\n"
                           "    let mut s = Stack { items: Vec::new() };\n"
                           "    push(&mut s, 1);\n"
                           "    let label = \"stack ready\";\n"
                           "    report(label);\n"
                           "}\n");
        }

        AnalysisEngine engine_;
    };

    TEST_F(NavigationTest, SearchIsCaseInsensitive) {
        const auto result = engine_.search("k", "STACK");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().status, ResponseStatus::Ok);

        const auto& found = result.value().data;
        const auto has = [&](const SearchResultType type, const std::string& file) {
            return std::ranges::any_of(found, [&](const SearchResult& r) {
                return r.result_type == type && r.file_path == file;
            });
        };
        EXPECT_TRUE(has(SearchResultType::Type, "src/stack.rs"));
        EXPECT_TRUE(has(SearchResultType::Function, "src/stack.rs"));
        EXPECT_TRUE(has(SearchResultType::Comment, "src/stack.rs"));
        EXPECT_TRUE(has(SearchResultType::String, "src/main.rs"));
    }

    TEST_F(NavigationTest, SearchResultsCarryLineContext) {
        const auto result = engine_.search("k", "label");
        ASSERT_TRUE(result.is_ok());
        ASSERT_FALSE(result.value().data.empty());

        const auto& first = result.value().data.front();
        EXPECT_EQ(first.file_path, "src/main.rs");
        EXPECT_EQ(first.result_type, SearchResultType::Variable);
        EXPECT_EQ(first.line, 4u);
        EXPECT_EQ(first.context, "let label = \"stack ready\";");
    }

    TEST_F(NavigationTest, SearchWithoutMatchesIsEmpty) {
        const auto result = engine_.search("k", "zebra");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().status, ResponseStatus::Empty);
        EXPECT_TRUE(result.value().data.empty());
    }

    TEST_F(NavigationTest, SearchRejectsEmptyQueryAndUnknownCorpus) {
        const auto empty = engine_.search("k", "");
        ASSERT_TRUE(empty.is_err());
        EXPECT_EQ(empty.error().code(), ErrorCode::InvalidArgument);

        const auto unknown = engine_.search("missing", "x");
        ASSERT_TRUE(unknown.is_err());
        EXPECT_EQ(unknown.error().code(), ErrorCode::NotFound);
    }

    TEST_F(NavigationTest, NavigateToFunctionInAnotherFile) {
        const auto result = engine_.navigate("src/main.rs", "push");
        ASSERT_TRUE(result.is_ok());

        const auto& location = result.value().data;
        EXPECT_EQ(location.symbol_type, SearchResultType::Function);
        EXPECT_EQ(location.file_path, "src/stack.rs");
        EXPECT_EQ(location.line, 6u);
        EXPECT_EQ(location.column, 11u);

        ASSERT_EQ(location.references.size(), 1u);
        EXPECT_EQ(location.references[0].file_path, "src/main.rs");
        EXPECT_EQ(location.references[0].line, 3u);
        EXPECT_EQ(location.references[0].context, "push(&mut s, 1);");
    }

    TEST_F(NavigationTest, NavigateToVariable) {
        const auto result = engine_.navigate("src/main.rs", "label");
        ASSERT_TRUE(result.is_ok());

        const auto& location = result.value().data;
        EXPECT_EQ(location.symbol_type, SearchResultType::Variable);
        EXPECT_EQ(location.file_path, "src/main.rs");
        EXPECT_EQ(location.line, 4u);
        ASSERT_EQ(location.references.size(), 1u);
        EXPECT_EQ(location.references[0].line, 5u);
    }

    TEST_F(NavigationTest, NavigateToType) {
        const auto result = engine_.navigate("src/main.rs", "Stack");
        ASSERT_TRUE(result.is_ok());

        const auto& location = result.value().data;
        EXPECT_EQ(location.symbol_type, SearchResultType::Type);
        EXPECT_EQ(location.file_path, "src/stack.rs");
        EXPECT_EQ(location.line, 2u);
        EXPECT_EQ(location.column, 11u);

        const bool from_main = std::ranges::any_of(location.references, [](const ReferenceInfo& r) {
            return r.file_path == "src/main.rs" && r.line == 2;
        });
        EXPECT_TRUE(from_main);
        const bool from_impl = std::ranges::any_of(location.references, [](const ReferenceInfo& r) {
            return r.file_path == "src/stack.rs" && r.line == 5;
        });
        EXPECT_TRUE(from_impl);
    }

    TEST_F(NavigationTest, UnknownSymbolIsNotFound) {
        const auto result = engine_.navigate("src/main.rs", "nothing_named_this");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
        EXPECT_EQ(result.error().context().value_or(""), "nothing_named_this");
    }

    TEST_F(NavigationTest, NavigateFromUnknownFileIsNotFound) {
        const auto result = engine_.navigate("src/missing.rs", "push");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

}  // namespace cie::engine
