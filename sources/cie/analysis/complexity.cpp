//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/complexity.hpp"
#include "cie/utils/string_utils.hpp"

#include <unordered_set>

namespace cie::analysis {

    namespace {
        bool is_conditional_branch(const std::string_view mnemonic) {
            static const std::unordered_set<std::string_view> branches = {
                // x86
                "je", "jne", "jz", "jnz", "jl", "jle", "jg", "jge", "ja", "jae", "jb", "jbe",
                "js", "jns", "jo", "jno", "loop", "loope", "loopne",
                // ARM / AArch64
                "beq", "bne", "blt", "ble", "bgt", "bge", "cbz", "cbnz", "tbz", "tbnz",
                "b.eq", "b.ne", "b.lt", "b.le", "b.gt", "b.ge", "b.hi", "b.lo",
                // RISC-V
                "beqz", "bnez"
            };
            return branches.contains(mnemonic);
        }

        /**
         * A return is final when nothing but the closing brace of its own
         * function follows its statement.
         */
        bool is_final_return(const lexer::TokenView& tokens, const std::size_t i, const FunctionInfo& function) {
            std::size_t j = i + 1;
            while (j < function.body_end) {
                if (tokens.is_operator(j, ";")) {
                    ++j;
                    break;
                }
                if (tokens.is_operator(j, "}")) {
                    break;
                }
                if (tokens.is_operator(j, "(") || tokens.is_operator(j, "[") || tokens.is_operator(j, "{")) {
                    j = tokens.matching_or_end(j);
                }
                ++j;
            }
            return j >= function.body_end;
        }
    }

    bool is_branch_construct(const lexer::TokenView& tokens, const std::size_t i, const Language language) {
        const Token& token = tokens[i];
        if (language == Language::Assembly) {
            return token.type == TokenType::Keyword && is_conditional_branch(string_utils::to_lower(token.value));
        }
        if (token.type == TokenType::Keyword) {
            return token.value == "if" || token.value == "while" || token.value == "for" ||
                   token.value == "loop" || token.value == "case" || token.value == "catch";
        }
        if (token.type == TokenType::Operator) {
            return token.value == "?" || (language == Language::Rust && token.value == "=>");
        }
        return false;
    }

    std::vector<int> compute_complexity(const lexer::TokenView& tokens,
                                        const std::vector<FunctionInfo>& functions,
                                        const Owners& owners,
                                        const Language language) {
        std::vector<int> complexity(functions.size(), 1);
        for (std::size_t i = 0; i < tokens.size() && i < owners.size(); ++i) {
            if (!owners[i]) {
                continue;
            }
            const std::size_t f = *owners[i];
            if (is_branch_construct(tokens, i, language)) {
                ++complexity[f];
            } else if (tokens.is_keyword(i, "return") && !is_final_return(tokens, i, functions[f])) {
                ++complexity[f];
            }
        }
        return complexity;
    }

}  // namespace cie::analysis
