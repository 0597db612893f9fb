//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/annotations.hpp"
#include "cie/analysis/knowledge.hpp"
#include "cie/utils/string_utils.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace cie::analysis {

    namespace {
        using NameSet = std::unordered_set<std::string_view>;

        const NameSet& interrupt_names() {
            static const NameSet names = {
                "request_irq", "free_irq", "request_threaded_irq", "enable_irq", "disable_irq",
                "register_interrupt_handler", "register_irq_handler", "set_irq_handler",
                "set_interrupt_handler", "idt_set_gate", "set_intr_gate", "local_irq_save",
                "local_irq_restore", "local_irq_disable", "local_irq_enable", "interrupt_handler"
            };
            return names;
        }

        const NameSet& context_switch_names() {
            static const NameSet names = {
                "context_switch", "switch_to", "__switch_to", "schedule", "sched_yield", "yield_now"
            };
            return names;
        }

        const NameSet& memory_names() {
            static const NameSet names = {
                "malloc", "calloc", "realloc", "free", "kmalloc", "kfree", "kzalloc", "vmalloc",
                "vfree", "mmap", "munmap", "brk", "sbrk", "alloc_pages", "__get_free_pages",
                "free_pages", "virtual_memory", "map_page", "unmap_page"
            };
            return names;
        }

        const NameSet& lock_names() {
            static const NameSet names = {
                "Mutex", "RwLock", "Semaphore", "SpinLock", "Spinlock", "spinlock_t", "spin_lock",
                "spin_unlock", "spin_lock_irqsave", "spin_unlock_irqrestore", "mutex_lock",
                "mutex_unlock", "pthread_mutex_lock", "pthread_mutex_unlock", "pthread_mutex_t"
            };
            return names;
        }

        bool followed_by_call(const lexer::TokenView& tokens, const std::size_t i) {
            return tokens.is_operator(i + 1, "(");
        }

        std::optional<ExplanationCategory> assembly_category(const lexer::TokenView& tokens, const std::size_t i) {
            if (tokens[i].type != TokenType::Keyword) {
                return std::nullopt;
            }
            const std::string mnemonic = string_utils::to_lower(tokens[i].value);
            if (mnemonic == "syscall" || mnemonic == "sysenter" || mnemonic == "svc" || mnemonic == "ecall") {
                return ExplanationCategory::SystemCall;
            }
            if (mnemonic == "int") {
                const std::size_t operand = tokens.is_operator(i + 1, "$") ? i + 2 : i + 1;
                if (tokens.valid(operand) && string_utils::to_lower(tokens[operand].value) == "0x80") {
                    return ExplanationCategory::SystemCall;
                }
                return ExplanationCategory::InterruptHandling;
            }
            if (mnemonic == "cli" || mnemonic == "sti" || mnemonic == "iret" || mnemonic == "iretq" ||
                mnemonic == "eret") {
                return ExplanationCategory::InterruptHandling;
            }
            if (mnemonic == "lock" || mnemonic == "xchg" || mnemonic == "cmpxchg") {
                return ExplanationCategory::Locking;
            }
            return std::nullopt;
        }

        EducationalComment make_comment(const std::size_t line,
                                        std::string text,
                                        const CommentCategory category,
                                        const ComplexityLevel level,
                                        std::vector<std::string> objectives) {
            return EducationalComment{line, std::move(text), category, level, std::move(objectives)};
        }

        /**
         * Pattern comment for the token at i, if one applies.
         */
        std::optional<EducationalComment> pattern_comment(const lexer::TokenView& tokens,
                                                          const std::size_t i,
                                                          const Language language) {
            const Token& token = tokens[i];
            const std::size_t line = token.line;

            if (language == Language::Rust && token.is_keyword("unsafe")) {
                return make_comment(line,
                    "unsafe keyword bypasses Rust's safety guarantees - use carefully when interfacing with low-level code",
                    CommentCategory::Warning, ComplexityLevel::Advanced,
                    {"memory safety", "unsafe Rust", "FFI"});
            }
            if (language == Language::Rust && token.is_keyword("static") && tokens.is_keyword(i + 1, "mut")) {
                return make_comment(line,
                    "static mut is global mutable state - every access is unsafe and races unless synchronized",
                    CommentCategory::Security, ComplexityLevel::Advanced,
                    {"global state", "data races", "interior mutability"});
            }

            const bool rust_spawn = token.value == "spawn" && i >= 2 && tokens.is_operator(i - 1, "::") &&
                                    tokens[i - 2].value == "thread";
            const bool std_thread = (token.value == "thread" || token.value == "jthread") && i >= 2 &&
                                    tokens.is_operator(i - 1, "::") && tokens[i - 2].value == "std";
            if (token.type == TokenType::Identifier &&
                (rust_spawn || std_thread || token.value == "pthread_create" || token.value == "kthread_create" ||
                 token.value == "kthread_run")) {
                return make_comment(line,
                    "Thread creation - enables concurrent execution; shared data now needs synchronization",
                    CommentCategory::Concept, ComplexityLevel::Intermediate,
                    {"concurrency", "threading", "parallelism"});
            }

            const bool std_mutex = token.value == "mutex" && i >= 2 && tokens.is_operator(i - 1, "::") &&
                                   tokens[i - 2].value == "std";
            if (token.type == TokenType::Identifier &&
                (std_mutex || token.value == "Mutex" || token.value == "RwLock" || token.value == "spinlock_t" ||
                 token.value == "pthread_mutex_t")) {
                return make_comment(line,
                    "Mutual exclusion primitive - prevents race conditions in concurrent access",
                    CommentCategory::Concept, ComplexityLevel::Advanced,
                    {"synchronization", "race conditions", "concurrency"});
            }

            const bool c_asm = language != Language::Rust && (token.is_keyword("asm") || token.is_keyword("__asm__"));
            const bool rust_asm = language == Language::Rust && token.type == TokenType::Identifier &&
                                  (token.value == "asm" || token.value == "global_asm") && tokens.is_operator(i + 1, "!");
            if (c_asm || rust_asm) {
                return make_comment(line,
                    "Inline assembly - hands exact instructions to the CPU; the compiler cannot check them",
                    CommentCategory::Concept, ComplexityLevel::Expert,
                    {"instruction set", "calling conventions", "register allocation"});
            }
            return std::nullopt;
        }

        /**
         * Bounded replacement for a C string function that cannot limit
         * its write.
         */
        std::optional<std::string_view> bounded_replacement(const std::string_view name) {
            static const std::unordered_map<std::string_view, std::string_view> replacements = {
                {"gets", "fgets"},
                {"strcpy", "strncpy or strlcpy"},
                {"strcat", "strncat or strlcat"},
                {"sprintf", "snprintf"},
                {"vsprintf", "vsnprintf"}
            };
            const auto it = replacements.find(name);
            if (it == replacements.end()) {
                return std::nullopt;
            }
            return it->second;
        }
    }

    std::optional<ExplanationCategory> explanation_category(const lexer::TokenView& tokens,
                                                            const std::size_t i,
                                                            const Language language,
                                                            const heuristics::CallConfig& calls) {
        const Token& token = tokens[i];
        if (language == Language::Assembly) {
            if (const auto category = assembly_category(tokens, i)) {
                return category;
            }
            if (token.type == TokenType::Identifier && interrupt_names().contains(token.value)) {
                return ExplanationCategory::InterruptHandling;
            }
            return std::nullopt;
        }

        if (token.type == TokenType::Operator) {
            if (language == Language::Rust && token.value == "*" &&
                (tokens.is_keyword(i + 1, "mut") || tokens.is_keyword(i + 1, "const"))) {
                return ExplanationCategory::UnsafeCode;
            }
            return std::nullopt;
        }

        if (token.type == TokenType::Keyword) {
            if (token.value == "unsafe" || token.value == "reinterpret_cast" || token.value == "asm" ||
                token.value == "__asm__") {
                return ExplanationCategory::UnsafeCode;
            }
            if (token.value == "new" || token.value == "delete") {
                return ExplanationCategory::MemoryManagement;
            }
            return std::nullopt;
        }

        if (token.type != TokenType::Identifier) {
            return std::nullopt;
        }
        const std::string& name = token.value;

        if (interrupt_names().contains(name) || string_utils::ends_with(name, "_isr") ||
            string_utils::ends_with(name, "_irq_handler")) {
            return ExplanationCategory::InterruptHandling;
        }
        if (context_switch_names().contains(name)) {
            return ExplanationCategory::ContextSwitch;
        }
        if (lock_names().contains(name) ||
            (name == "lock" && i > 0 && tokens.is_operator(i - 1, ".") && followed_by_call(tokens, i))) {
            return ExplanationCategory::Locking;
        }
        if ((memory_names().contains(name) && followed_by_call(tokens, i)) ||
            (name == "Box" && tokens.is_operator(i + 1, "::") && tokens.valid(i + 2) && tokens[i + 2].value == "new")) {
            return ExplanationCategory::MemoryManagement;
        }
        if (name == "syscall" ||
            (followed_by_call(tokens, i) &&
             std::ranges::find(calls.system_call_names, name) != calls.system_call_names.end())) {
            return ExplanationCategory::SystemCall;
        }
        return std::nullopt;
    }

    std::vector<InlineExplanation> inline_explanations(const lexer::TokenView& tokens,
                                                       const Language language,
                                                       const heuristics::CallConfig& calls) {
        std::vector<InlineExplanation> explanations;
        std::set<std::pair<std::size_t, ExplanationCategory>> seen;

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto category = explanation_category(tokens, i, language, calls);
            if (!category) {
                continue;
            }
            const Token& token = tokens[i];
            if (!seen.emplace(token.line, *category).second) {
                continue;
            }

            const ExplanationEntry& entry = explanation_for(*category);
            InlineExplanation explanation;
            explanation.line = token.line;
            explanation.start_col = token.start_col;
            explanation.end_col = token.is_operator("*") && tokens.valid(i + 1) ? tokens[i + 1].end_col : token.end_col;
            explanation.explanation = std::string(entry.explanation);
            explanation.complexity_level = entry.level;
            explanation.related_concepts = entry.related_concepts;
            explanation.category = *category;
            explanations.push_back(std::move(explanation));
        }
        return explanations;
    }

    std::vector<std::size_t> unused_variables(const std::vector<FunctionInfo>& functions,
                                              const std::vector<VariableInfo>& variables,
                                              const std::vector<VariableTrace>& traces) {
        // variable name -> functions in which it is read
        std::unordered_map<std::string, std::unordered_set<std::string>> read_in;
        for (const auto& trace : traces) {
            const bool has_read = std::ranges::any_of(trace.steps, [](const DataFlowStep& step) {
                return step.operation == DataFlowOperation::Read;
            });
            if (has_read) {
                read_in[trace.variable].insert(trace.function_name);
            }
        }

        std::vector<std::size_t> unused;
        for (std::size_t v = 0; v < variables.size(); ++v) {
            const VariableInfo& variable = variables[v];
            if (!variable.function_index || variable.name.starts_with('_') ||
                *variable.function_index >= functions.size()) {
                continue;
            }

            bool is_read = false;
            if (const auto it = read_in.find(variable.name); it != read_in.end()) {
                for (std::size_t f = 0; f < functions.size() && !is_read; ++f) {
                    for (std::optional<std::size_t> a = f; a; a = functions[*a].parent) {
                        if (*a == *variable.function_index) {
                            is_read = it->second.contains(functions[f].name);
                            break;
                        }
                    }
                }
            }
            if (!is_read) {
                unused.push_back(v);
            }
        }
        return unused;
    }

    std::vector<EducationalComment> educational_comments(const lexer::TokenView& tokens,
                                                         const Language language,
                                                         const std::vector<FunctionInfo>& functions,
                                                         const std::vector<VariableInfo>& variables,
                                                         const std::vector<VariableTrace>& traces) {
        std::vector<EducationalComment> comments;
        std::set<std::pair<std::size_t, std::string>> seen;
        const auto add = [&](EducationalComment comment) {
            if (seen.emplace(comment.line, comment.comment).second) {
                comments.push_back(std::move(comment));
            }
        };

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (auto comment = pattern_comment(tokens, i, language)) {
                add(std::move(*comment));
            }
        }

        const std::string_view advice = language == Language::Rust
            ? "; remove it or prefix its name with an underscore"
            : "; remove it or mark it as intentionally unused";
        for (const std::size_t v : unused_variables(functions, variables, traces)) {
            const VariableInfo& variable = variables[v];
            add(make_comment(variable.line,
                             "Variable '" + variable.name + "' is declared but never read" + std::string(advice),
                             CommentCategory::BestPractice, ComplexityLevel::Beginner,
                             {"dead code", "compiler warnings"}));
        }

        std::ranges::stable_sort(comments, {}, &EducationalComment::line);
        return comments;
    }

    std::vector<CodeSuggestion> code_suggestions(const lexer::TokenView& tokens,
                                                 const Language language,
                                                 const std::vector<FunctionInfo>& functions,
                                                 const std::vector<int>& loop_depths,
                                                 const heuristics::ComplexityConfig& complexity) {
        std::vector<CodeSuggestion> suggestions;

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const Token& token = tokens[i];
            const bool in_loop = i < loop_depths.size() && loop_depths[i] > 0;
            const bool method = i > 0 && tokens.is_operator(i - 1, ".") && token.type == TokenType::Identifier;
            const bool called = tokens.is_operator(i + 1, "(") || tokens.is_operator(i + 1, "::");

            if (language == Language::Rust && method && called) {
                if (token.value == "unwrap") {
                    suggestions.push_back(CodeSuggestion{
                        token.line, token.start_col, "error_handling",
                        "Consider using the ? operator or explicit error handling instead of unwrap()",
                        SuggestionSeverity::Warning, "Propagate the error with ? or handle it with match"
                    });
                } else if (token.value == "expect") {
                    suggestions.push_back(CodeSuggestion{
                        token.line, token.start_col, "error_handling",
                        "expect() panics on error; prefer propagating the error to the caller",
                        SuggestionSeverity::Warning, "Return a Result and use the ? operator"
                    });
                } else if (in_loop && (token.value == "clone" || token.value == "collect")) {
                    suggestions.push_back(CodeSuggestion{
                        token.line, token.start_col, "performance_hint",
                        token.value + "() inside a loop allocates on every iteration",
                        SuggestionSeverity::Info,
                        token.value == "clone" ? "Borrow the value, or clone once before the loop"
                                               : "Keep the iterator lazy or collect once outside the loop"
                    });
                }
            }

            if (language == Language::Rust && token.value == "String" && tokens.is_operator(i + 1, "::") &&
                tokens.valid(i + 2) && tokens[i + 2].value == "from" && tokens.is_operator(i + 3, "(") &&
                tokens.valid(i + 4) && tokens[i + 4].type == TokenType::String) {
                suggestions.push_back(CodeSuggestion{
                    token.line, token.start_col, "performance_hint",
                    "Consider using string literals directly or Cow for performance",
                    SuggestionSeverity::Info, "Use &str instead of String::from() for string literals"
                });
            }

            if (language != Language::Rust && token.type == TokenType::Identifier && tokens.is_operator(i + 1, "(")) {
                if (const auto replacement = bounded_replacement(token.value)) {
                    suggestions.push_back(CodeSuggestion{
                        token.line, token.start_col, "security",
                        "'" + token.value + "' does not bound its write and can overflow the destination buffer",
                        SuggestionSeverity::Error, "Use " + std::string(*replacement) + " instead"
                    });
                }
            }

            if (language != Language::Rust && token.is_keyword("goto")) {
                suggestions.push_back(CodeSuggestion{
                    token.line, token.start_col, "control_flow",
                    "goto makes control flow harder to follow; keep it to error-unwinding paths",
                    SuggestionSeverity::Info, std::nullopt
                });
            }
        }

        for (const auto& function : functions) {
            if (function.complexity > complexity.medium_threshold) {
                suggestions.push_back(CodeSuggestion{
                    function.location.line, function.location.column, "complexity",
                    "Function '" + function.name + "' has complexity " + std::to_string(function.complexity) +
                        "; consider splitting it into smaller functions",
                    SuggestionSeverity::Warning, "Extract independent branches into helper functions"
                });
            }
        }

        std::ranges::stable_sort(suggestions, [](const CodeSuggestion& a, const CodeSuggestion& b) {
            return std::tie(a.line, a.column) < std::tie(b.line, b.column);
        });
        return suggestions;
    }

}  // namespace cie::analysis
