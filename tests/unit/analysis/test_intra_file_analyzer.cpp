//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/annotations.hpp"
#include "cie/analysis/intra_file_analyzer.hpp"
#include "helpers/parsed_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace cie::analysis
{
    class IntraFileAnalyzerTest : public ::testing::Test {
    protected:
        IntraFileResult analyze(const std::string& source, const Language language) {
            parsed_ = std::make_unique<test::ParsedSource>(source, language);
            const IntraFileAnalyzer analyzer(language, config_);
            return analyzer.analyze(parsed_->tokens(), parsed_->functions(), parsed_->variables(),
                                    parsed_->owners());
        }

        static std::size_t count_category(const std::vector<InlineExplanation>& explanations,
                                          const ExplanationCategory category) {
            return static_cast<std::size_t>(std::ranges::count(explanations, category, &InlineExplanation::category));
        }

        heuristics::HeuristicsConfig config_ = heuristics::HeuristicsConfig::defaults();
        std::unique_ptr<test::ParsedSource> parsed_;
    };

    TEST_F(IntraFileAnalyzerTest, FillsComplexityAndDescriptions) {
        const auto result = analyze(
            "int schedule(void) {\n"
            "    if (ready) { return 1; }\n"
            "    return 0;\n"
            "}\n"
            "int helper(void) { return 2; }\n",
            Language::C);

        const auto& functions = parsed_->functions();
        ASSERT_EQ(functions.size(), 2u);
        EXPECT_EQ(functions[0].complexity, 3);
        EXPECT_EQ(functions[1].complexity, 1);
        EXPECT_EQ(result.complexity_score, 4);
        ASSERT_TRUE(functions[0].educational_description.has_value());
        EXPECT_NE(functions[0].educational_description->find("Scheduler"), std::string::npos);
        EXPECT_FALSE(functions[1].educational_description.has_value());
    }

    TEST_F(IntraFileAnalyzerTest, InterruptRegistrationExplainedOncePerLine) {
        const auto result = analyze(
            "static int setup(void) {\n"
            "    request_irq(IRQ_TIMER, timer_isr, 0, \"timer\", NULL);\n"
            "    return 0;\n"
            "}\n",
            Language::C);

        ASSERT_EQ(count_category(result.inline_explanations, ExplanationCategory::InterruptHandling), 1u);
        const auto& explanation = result.inline_explanations.front();
        EXPECT_EQ(explanation.line, 2u);
        EXPECT_EQ(explanation.start_col, 4u);
        EXPECT_FALSE(explanation.explanation.empty());
        EXPECT_FALSE(explanation.related_concepts.empty());
    }

    TEST_F(IntraFileAnalyzerTest, RustUnsafeAndRawPointers) {
        const auto result = analyze(
            "fn poke(addr: usize) {\n"
            "    let p = addr as *mut u32;\n"
            "    unsafe { *p = 1; }\n"
            "}\n",
            Language::Rust);

        EXPECT_EQ(count_category(result.inline_explanations, ExplanationCategory::UnsafeCode), 2u);
        const bool warns_unsafe = std::ranges::any_of(result.educational_comments, [](const EducationalComment& c) {
            return c.category == CommentCategory::Warning && c.line == 3;
        });
        EXPECT_TRUE(warns_unsafe);
    }

    TEST_F(IntraFileAnalyzerTest, AssemblySyscallInstruction) {
        const auto result = analyze(
            "_start:\n"
            "    mov $60, %rax\n"
            "    syscall\n",
            Language::Assembly);

        ASSERT_EQ(result.inline_explanations.size(), 1u);
        EXPECT_EQ(result.inline_explanations[0].category, ExplanationCategory::SystemCall);
        EXPECT_EQ(result.inline_explanations[0].line, 3u);
    }

    TEST_F(IntraFileAnalyzerTest, UnusedVariableComment) {
        const auto result = analyze(
            "fn main() {\n"
            "    let unused = 5;\n"
            "    let _ignored = 6;\n"
            "    let used = 7;\n"
            "    println!(\"{}\", used);\n"
            "}\n",
            Language::Rust);

        std::vector<std::string> flagged;
        for (const auto& comment : result.educational_comments) {
            if (comment.category == CommentCategory::BestPractice) {
                flagged.push_back(comment.comment);
            }
        }
        ASSERT_EQ(flagged.size(), 1u);
        EXPECT_NE(flagged[0].find("'unused'"), std::string::npos);
    }

    TEST_F(IntraFileAnalyzerTest, VariableReadOnlyInClosureIsUsed) {
        test::ParsedSource parsed(
            "fn outer() {\n"
            "    let total = 0;\n"
            "    let add = |x| { total + x };\n"
            "    add(1);\n"
            "}\n",
            Language::Rust);
        const IntraFileAnalyzer analyzer(Language::Rust, config_);
        const auto result = analyzer.analyze(parsed.tokens(), parsed.functions(), parsed.variables(), parsed.owners());

        const auto unused = unused_variables(parsed.functions(), parsed.variables(), result.data_flow);
        for (const std::size_t v : unused) {
            EXPECT_NE(parsed.variables()[v].name, "total");
        }
    }

    TEST_F(IntraFileAnalyzerTest, RustSuggestions) {
        const auto result = analyze(
            "fn load(items: Vec<String>) {\n"
            "    let name = String::from(\"init\");\n"
            "    let value = read().unwrap();\n"
            "    for item in items.iter() {\n"
            "        let copy = item.clone();\n"
            "    }\n"
            "}\n",
            Language::Rust);

        std::vector<std::string> types;
        for (const auto& suggestion : result.suggestions) {
            types.push_back(suggestion.suggestion_type);
        }
        EXPECT_EQ(types, (std::vector<std::string>{"performance_hint", "error_handling", "performance_hint"}));
        EXPECT_EQ(result.suggestions[1].severity, SuggestionSeverity::Warning);
        EXPECT_EQ(result.suggestions[1].line, 3u);
    }

    TEST_F(IntraFileAnalyzerTest, CUnboundedCopyIsSecurityError) {
        const auto result = analyze(
            "void copy(char *dst, const char *src) {\n"
            "    strcpy(dst, src);\n"
            "}\n",
            Language::C);

        ASSERT_EQ(result.suggestions.size(), 1u);
        EXPECT_EQ(result.suggestions[0].suggestion_type, "security");
        EXPECT_EQ(result.suggestions[0].severity, SuggestionSeverity::Error);
        EXPECT_EQ(result.suggestions[0].fix_suggestion.value_or(""), "Use strncpy or strlcpy instead");
    }

    TEST_F(IntraFileAnalyzerTest, ComplexFunctionGetsSplitSuggestion) {
        config_.complexity.medium_threshold = 2;
        const auto result = analyze(
            "int f(int a, int b) {\n"
            "    if (a) { a++; }\n"
            "    if (b) { b++; }\n"
            "    return a + b;\n"
            "}\n",
            Language::C);

        ASSERT_EQ(result.suggestions.size(), 1u);
        EXPECT_EQ(result.suggestions[0].suggestion_type, "complexity");
        EXPECT_EQ(result.suggestions[0].line, 1u);
    }

    TEST_F(IntraFileAnalyzerTest, SuggestionsAreSortedByPosition) {
        const auto result = analyze(
            "void f(char *d, char *s) {\n"
            "    goto out;\n"
            "    strcat(d, s);\n"
            "    sprintf(d, \"%s\", s);\n"
            "out:\n"
            "    return;\n"
            "}\n",
            Language::C);

        ASSERT_EQ(result.suggestions.size(), 3u);
        EXPECT_TRUE(std::ranges::is_sorted(result.suggestions, {}, &CodeSuggestion::line));
    }

}  // namespace cie::analysis
