//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/complexity.hpp"
#include "helpers/parsed_source.hpp"

#include <gtest/gtest.h>

namespace cie::analysis
{
    namespace {
        std::vector<int> complexity_of(const std::string& source, const Language language) {
            test::ParsedSource parsed(source, language);
            return compute_complexity(parsed.tokens(), parsed.functions(), parsed.owners(), language);
        }
    }

    TEST(ComplexityTest, StraightLineFunctionIsOne) {
        const auto complexity = complexity_of("fn main() {\n    let x = 1;\n}\n", Language::Rust);
        EXPECT_EQ(complexity, std::vector<int>{1});
    }

    TEST(ComplexityTest, FinalReturnIsFree) {
        const auto complexity = complexity_of("int add(int a, int b) { return a + b; }\n", Language::C);
        EXPECT_EQ(complexity, std::vector<int>{1});
    }

    TEST(ComplexityTest, EarlyReturnAndIfCount) {
        const auto complexity = complexity_of(
            "int sign(int x) {\n"
            "    if (x > 0) {\n"
            "        return 1;\n"
            "    }\n"
            "    return 0;\n"
            "}\n",
            Language::C);
        EXPECT_EQ(complexity, std::vector<int>{3});
    }

    TEST(ComplexityTest, LoopsAndCasesCount) {
        const auto complexity = complexity_of(
            "void f(int n) {\n"
            "    for (int i = 0; i < n; i++) { }\n"
            "    while (n) { n--; }\n"
            "    switch (n) { case 0: break; case 1: break; }\n"
            "}\n",
            Language::C);
        EXPECT_EQ(complexity, std::vector<int>{5});
    }

    TEST(ComplexityTest, MatchArmsAndQuestionMarkCount) {
        const auto complexity = complexity_of(
            "fn pick(x: u8) -> u8 {\n"
            "    match x {\n"
            "        0 => 1,\n"
            "        _ => 2,\n"
            "    }\n"
            "}\n"
            "fn load() -> Result<u8, Error> {\n"
            "    let v = read()?;\n"
            "    Ok(v)\n"
            "}\n",
            Language::Rust);
        EXPECT_EQ(complexity, (std::vector<int>{3, 2}));
    }

    TEST(ComplexityTest, ClosureBranchesBelongToClosure) {
        const auto complexity = complexity_of(
            "fn run() {\n"
            "    let f = |x| { if x { 1 } else { 2 } };\n"
            "}\n",
            Language::Rust);
        ASSERT_EQ(complexity.size(), 2u);
        EXPECT_EQ(complexity[0], 1);
        EXPECT_EQ(complexity[1], 2);
    }

    TEST(ComplexityTest, InterruptRegistrationIsStraightLine) {
        const auto complexity = complexity_of(
            "static int setup(void) {\n"
            "    request_irq(IRQ_TIMER, timer_isr, 0, \"timer\", NULL);\n"
            "    return 0;\n"
            "}\n",
            Language::C);
        EXPECT_EQ(complexity, std::vector<int>{1});
    }

    TEST(ComplexityTest, AssemblyConditionalBranchesCount) {
        const auto complexity = complexity_of(
            "check:\n"
            "    cmp $0, %eax\n"
            "    je done\n"
            "    jne check\n"
            "done:\n"
            "    ret\n",
            Language::Assembly);
        EXPECT_EQ(complexity, (std::vector<int>{3, 1}));
    }

    TEST(ComplexityTest, AddingABranchNeverLowersComplexity) {
        const auto before = complexity_of("int f(int x) { x++; return x; }\n", Language::C);
        const auto after = complexity_of("int f(int x) { if (x) { x++; } return x; }\n", Language::C);
        ASSERT_EQ(before.size(), 1u);
        ASSERT_EQ(after.size(), 1u);
        EXPECT_GT(after[0], before[0]);
    }

    TEST(ComplexityTest, BranchConstructRecognition) {
        test::ParsedSource parsed("fn f() { if a { } let b = c?; }\n", Language::Rust);
        const auto& tokens = parsed.tokens();
        std::size_t branches = 0;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (is_branch_construct(tokens, i, Language::Rust)) {
                ++branches;
            }
        }
        EXPECT_EQ(branches, 2u);
    }

}  // namespace cie::analysis
