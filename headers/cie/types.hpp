//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_TYPES_HPP
#define CIE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for source code analysis.
 *
 * This header defines the facts produced by the analysis pipeline and
 * consumed by the JSON contract. Types are organized into categories:
 *
 * - Basic Types: Language, CodeLocation, Diagnostic, Severity
 * - Lexing: TokenType, Token
 * - Per-file Facts: FunctionInfo, VariableInfo, TypeInfo, ImportInfo,
 *   InlineExplanation, EducationalComment, DataFlowStep, CallSite
 * - Aggregates: CodeAnalysis, FileArtifacts
 * - Global Facts: CallGraphNode, CallGraphEdge, CallGraph, PerformanceHotspot
 * - Learner Aids: CodeSuggestion, OptimizationSuggestion, SearchResult,
 *   NavigationLocation
 *
 * Lines are 1-based, columns are 0-based byte offsets within the line.
 * Every fact kind is a closed enum so rule tables can switch over it
 * exhaustively.
 */

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace cie {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    /**
     * Source dialect of a file. Picks the lexer keyword table and the
     * function definition patterns.
     */
    enum class Language {
        Unknown,
        Rust,
        C,
        Cpp,
        Assembly
    };

    inline const char* to_string(Language language) noexcept {
        switch (language) {
            case Language::Unknown:  return "unknown";
            case Language::Rust:     return "rust";
            case Language::C:        return "c";
            case Language::Cpp:      return "cpp";
            case Language::Assembly: return "assembly";
        }
        return "unknown";
    }

    /**
     * Parses a language name ("rust", "c", "cpp", "assembly"). Accepts the
     * common aliases "c++", "asm" and "auto"/"unknown" for Unknown.
     */
    std::optional<Language> language_from_string(std::string_view name);

    /**
     * Derives the language hint from a file extension.
     */
    Language language_from_path(const fs::path& path);

    /**
     * A position in one source file. Never mutated after creation.
     */
    struct CodeLocation {
        std::string file_path;
        std::size_t line = 0;
        std::size_t column = 0;

        bool operator==(const CodeLocation&) const = default;

        bool operator<(const CodeLocation& other) const {
            return std::tie(file_path, line, column) <
                   std::tie(other.file_path, other.line, other.column);
        }
    };

    /**
     * Ordered severity scale shared by hotspots, node impact and
     * optimization potential.
     */
    enum class Severity {
        Low,
        Medium,
        High,
        Critical
    };

    inline const char* to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Low:      return "low";
            case Severity::Medium:   return "medium";
            case Severity::High:     return "high";
            case Severity::Critical: return "critical";
        }
        return "low";
    }

    /**
     * Rank used for ordering, critical highest.
     */
    constexpr int severity_rank(Severity severity) noexcept {
        return static_cast<int>(severity);
    }

    /**
     * Returns the next severity level up, saturating at Critical.
     */
    constexpr Severity escalate(Severity severity) noexcept {
        return severity == Severity::Critical
            ? Severity::Critical
            : static_cast<Severity>(static_cast<int>(severity) + 1);
    }

    enum class DiagnosticLevel {
        Info,
        Warning,
        Error
    };

    inline const char* to_string(DiagnosticLevel level) noexcept {
        switch (level) {
            case DiagnosticLevel::Info:    return "info";
            case DiagnosticLevel::Warning: return "warning";
            case DiagnosticLevel::Error:   return "error";
        }
        return "info";
    }

    /**
     * A non-fatal issue found while processing a file. Stages return these
     * next to their (possibly partial) output instead of aborting.
     */
    struct Diagnostic {
        DiagnosticLevel level = DiagnosticLevel::Warning;
        std::string code;
        std::string message;
        CodeLocation location;
    };

    // ============================================================================
    // Lexing
    // ============================================================================

    enum class TokenType {
        Keyword,
        Identifier,
        String,
        Comment,
        Number,
        Operator,
        Unknown
    };

    inline const char* to_string(TokenType type) noexcept {
        switch (type) {
            case TokenType::Keyword:    return "keyword";
            case TokenType::Identifier: return "identifier";
            case TokenType::String:     return "string";
            case TokenType::Comment:    return "comment";
            case TokenType::Number:     return "number";
            case TokenType::Operator:   return "operator";
            case TokenType::Unknown:    return "unknown";
        }
        return "unknown";
    }

    /**
     * One classified token. A multi-line token (block comment, string)
     * starts at (line, start_col) and ends at (end_line, end_col).
     */
    struct Token {
        TokenType type = TokenType::Unknown;
        std::string value;
        std::size_t line = 0;
        std::size_t start_col = 0;
        std::size_t end_col = 0;
        std::size_t end_line = 0;
        std::size_t offset = 0;
        std::size_t length = 0;

        [[nodiscard]] bool is(TokenType t, std::string_view v) const noexcept {
            return type == t && value == v;
        }

        [[nodiscard]] bool is_operator(std::string_view v) const noexcept {
            return type == TokenType::Operator && value == v;
        }

        [[nodiscard]] bool is_keyword(std::string_view v) const noexcept {
            return type == TokenType::Keyword && value == v;
        }

        [[nodiscard]] bool is_trivia() const noexcept {
            return type == TokenType::Comment;
        }
    };

    // ============================================================================
    // Per-file Facts
    // ============================================================================

    /**
     * A function, method, closure or assembly label definition.
     *
     * Body tokens are the half-open range [body_begin, body_end) of the
     * file's token stream. For brace bodies body_begin is the opening brace
     * and body_end the matching closing brace, or the stream size when the
     * body was never closed.
     */
    struct FunctionInfo {
        std::string name;
        std::string signature;
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        std::vector<std::string> parameters;
        std::string return_type;
        int complexity = 0;
        std::optional<std::string> educational_description;

        CodeLocation location;
        std::size_t signature_begin = 0;
        std::size_t body_begin = 0;
        std::size_t body_end = 0;
        std::optional<std::size_t> parent;
        bool is_closure = false;

        /**
         * Last path segment of the name: "Scheduler::tick" -> "tick",
         * "<Foo as Display>::fmt" -> "fmt".
         */
        [[nodiscard]] std::string simple_name() const;

        [[nodiscard]] bool contains_token(std::size_t index) const noexcept {
            return index >= body_begin && index < body_end;
        }
    };

    enum class VariableScope {
        Global,
        Function,
        Block
    };

    inline const char* to_string(VariableScope scope) noexcept {
        switch (scope) {
            case VariableScope::Global:   return "global";
            case VariableScope::Function: return "function";
            case VariableScope::Block:    return "block";
        }
        return "global";
    }

    /**
     * A declared variable or parameter. Scope is fixed at creation.
     */
    struct VariableInfo {
        std::string name;
        std::string var_type;
        std::size_t line = 0;
        VariableScope scope = VariableScope::Global;
        bool is_mutable = false;
        std::optional<std::string> initialized_value;

        CodeLocation location;
        std::size_t token_index = 0;
        std::optional<std::size_t> function_index;
    };

    struct TypeField {
        std::string name;
        std::string field_type;
        bool is_public = false;
    };

    struct TypeInfo {
        std::string name;
        std::string definition;
        std::size_t line = 0;
        std::vector<TypeField> fields;
        bool is_builtin = false;
    };

    struct ImportInfo {
        std::string module;
        std::vector<std::string> items;
        bool is_external = false;
        std::size_t line = 0;
    };

    enum class ComplexityLevel {
        Beginner,
        Intermediate,
        Advanced,
        Expert
    };

    inline const char* to_string(ComplexityLevel level) noexcept {
        switch (level) {
            case ComplexityLevel::Beginner:     return "beginner";
            case ComplexityLevel::Intermediate: return "intermediate";
            case ComplexityLevel::Advanced:     return "advanced";
            case ComplexityLevel::Expert:       return "expert";
        }
        return "beginner";
    }

    /**
     * Kind of teaching moment an inline explanation covers.
     */
    enum class ExplanationCategory {
        SystemCall,
        MemoryManagement,
        InterruptHandling,
        ContextSwitch,
        Locking,
        UnsafeCode
    };

    inline const char* to_string(ExplanationCategory category) noexcept {
        switch (category) {
            case ExplanationCategory::SystemCall:        return "system_call";
            case ExplanationCategory::MemoryManagement:  return "memory_management";
            case ExplanationCategory::InterruptHandling: return "interrupt_handling";
            case ExplanationCategory::ContextSwitch:     return "context_switch";
            case ExplanationCategory::Locking:           return "locking";
            case ExplanationCategory::UnsafeCode:        return "unsafe_code";
        }
        return "system_call";
    }

    struct InlineExplanation {
        std::size_t line = 0;
        std::size_t start_col = 0;
        std::size_t end_col = 0;
        std::string explanation;
        ComplexityLevel complexity_level = ComplexityLevel::Beginner;
        std::vector<std::string> related_concepts;
        ExplanationCategory category = ExplanationCategory::SystemCall;
    };

    enum class CommentCategory {
        Concept,
        BestPractice,
        Warning,
        Performance,
        Security,
        Educational
    };

    inline const char* to_string(CommentCategory category) noexcept {
        switch (category) {
            case CommentCategory::Concept:      return "concept";
            case CommentCategory::BestPractice: return "best_practice";
            case CommentCategory::Warning:      return "warning";
            case CommentCategory::Performance:  return "performance";
            case CommentCategory::Security:     return "security";
            case CommentCategory::Educational:  return "educational";
        }
        return "educational";
    }

    struct EducationalComment {
        std::size_t line = 0;
        std::string comment;
        CommentCategory category = CommentCategory::Educational;
        ComplexityLevel difficulty_level = ComplexityLevel::Beginner;
        std::vector<std::string> learning_objectives;
    };

    enum class DataFlowOperation {
        Declare,
        Read,
        Write,
        Modify
    };

    inline const char* to_string(DataFlowOperation op) noexcept {
        switch (op) {
            case DataFlowOperation::Declare: return "declare";
            case DataFlowOperation::Read:    return "read";
            case DataFlowOperation::Write:   return "write";
            case DataFlowOperation::Modify:  return "modify";
        }
        return "read";
    }

    struct DataFlowStep {
        std::size_t line = 0;
        DataFlowOperation operation = DataFlowOperation::Read;
        std::string from;
        std::string to;
        std::string description;
    };

    /**
     * All data-flow steps of one variable inside one function.
     */
    struct VariableTrace {
        std::string variable;
        std::string function_name;
        std::vector<DataFlowStep> steps;
    };

    enum class CallKind {
        Local,
        Recursive,
        SystemCall,
        CrossFile
    };

    inline const char* to_string(CallKind kind) noexcept {
        switch (kind) {
            case CallKind::Local:      return "local";
            case CallKind::Recursive:  return "recursive";
            case CallKind::SystemCall: return "system_call";
            case CallKind::CrossFile:  return "cross_file";
        }
        return "local";
    }

    /**
     * A provisional call edge. Final only after global linking.
     */
    struct CallSite {
        std::string caller;
        std::size_t caller_index = 0;
        std::string callee;
        CallKind kind = CallKind::Local;
        CodeLocation location;
        std::size_t token_index = 0;
    };

    // ============================================================================
    // Learner Aids
    // ============================================================================

    enum class SuggestionSeverity {
        Info,
        Warning,
        Error
    };

    inline const char* to_string(SuggestionSeverity severity) noexcept {
        switch (severity) {
            case SuggestionSeverity::Info:    return "info";
            case SuggestionSeverity::Warning: return "warning";
            case SuggestionSeverity::Error:   return "error";
        }
        return "info";
    }

    struct CodeSuggestion {
        std::size_t line = 0;
        std::size_t column = 0;
        std::string suggestion_type;
        std::string message;
        SuggestionSeverity severity = SuggestionSeverity::Info;
        std::optional<std::string> fix_suggestion;
    };

    // ============================================================================
    // Aggregates
    // ============================================================================

    /**
     * Aggregate root of one file's analysis. Exclusively owns its children.
     */
    struct CodeAnalysis {
        std::string file_path;
        Language language = Language::Unknown;
        std::vector<Token> syntax_highlighting;
        std::vector<FunctionInfo> functions;
        std::vector<VariableInfo> variables;
        std::vector<TypeInfo> types;
        std::vector<ImportInfo> imports;
        std::vector<InlineExplanation> inline_explanations;
        int complexity_score = 0;
        std::vector<EducationalComment> educational_comments;
    };

    /**
     * Everything Stage 1 produces for one file. This is the unit stored in
     * the per-file cache and handed to the linker.
     */
    struct FileArtifacts {
        std::string file_path;
        std::string content_hash;
        CodeAnalysis analysis;
        std::vector<VariableTrace> data_flow;
        std::vector<CallSite> call_sites;
        std::vector<CodeSuggestion> suggestions;
        std::vector<Diagnostic> diagnostics;
        std::vector<std::string> lines;
        bool failed = false;
        std::optional<std::string> failure_message;
    };

    // ============================================================================
    // Global Facts
    // ============================================================================

    struct CallGraphNode {
        std::string id;
        std::string function_name;
        std::optional<std::string> file_path;
        std::optional<std::size_t> line_number;
        int complexity = 0;
        bool is_extern = false;
        bool is_entry_point = false;
        std::size_t call_count = 0;
        Severity performance_impact = Severity::Medium;
    };

    struct CallGraphEdge {
        std::string from;
        std::string to;
        std::size_t call_count = 0;
        bool is_recursive = false;
        bool is_cross_file = false;
        bool is_system_call = false;
    };

    /**
     * Flat arena of nodes and edges. Edges refer to nodes by id only.
     */
    struct CallGraph {
        std::vector<CallGraphNode> nodes;
        std::vector<CallGraphEdge> edges;
        std::vector<std::string> entry_points;
        int complexity_score = 0;
        std::map<std::size_t, std::size_t> call_depth_distribution;

        [[nodiscard]] const CallGraphNode* find_node(std::string_view id) const;
    };

    enum class HotspotType {
        SystemCall,
        MemoryAllocation,
        Loop,
        Synchronization,
        IoBound,
        CpuIntensive,
        CacheMiss
    };

    inline const char* to_string(HotspotType type) noexcept {
        switch (type) {
            case HotspotType::SystemCall:       return "system_call";
            case HotspotType::MemoryAllocation: return "memory_allocation";
            case HotspotType::Loop:             return "loop";
            case HotspotType::Synchronization:  return "synchronization";
            case HotspotType::IoBound:          return "io_bound";
            case HotspotType::CpuIntensive:     return "cpu_intensive";
            case HotspotType::CacheMiss:        return "cache_miss";
        }
        return "loop";
    }

    struct PerformanceHotspot {
        CodeLocation location;
        HotspotType hotspot_type = HotspotType::Loop;
        Severity severity = Severity::Low;
        Severity estimated_impact = Severity::Low;
        std::string description;
        std::string educational_context;
        Severity optimization_potential = Severity::Low;

        std::string function_name;
        std::string rule;
    };

    struct OptimizationSuggestion {
        CodeLocation location;
        std::string suggestion_type;
        Severity priority = Severity::Low;
        std::string description;
        std::string implementation_effort;
        std::string expected_improvement;
        std::string code_example;
        std::string educational_explanation;
        std::vector<std::string> related_concepts;
    };

    enum class SearchResultType {
        Function,
        Variable,
        Type,
        Comment,
        String
    };

    inline const char* to_string(SearchResultType type) noexcept {
        switch (type) {
            case SearchResultType::Function: return "function";
            case SearchResultType::Variable: return "variable";
            case SearchResultType::Type:     return "type";
            case SearchResultType::Comment:  return "comment";
            case SearchResultType::String:   return "string";
        }
        return "function";
    }

    struct SearchResult {
        std::string file_path;
        std::size_t line = 0;
        std::string match_text;
        std::string context;
        SearchResultType result_type = SearchResultType::Function;
    };

    struct ReferenceInfo {
        std::string file_path;
        std::size_t line = 0;
        std::string context;
    };

    struct NavigationLocation {
        std::string file_path;
        std::size_t line = 0;
        std::size_t column = 0;
        SearchResultType symbol_type = SearchResultType::Function;
        std::vector<ReferenceInfo> references;
    };

}  // namespace cie

#endif //CIE_TYPES_HPP
