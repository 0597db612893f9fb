//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/hotspots/hotspot_classifier.hpp"
#include "cie/analysis/spans.hpp"
#include "cie/calls/call_site_resolver.hpp"
#include "cie/hotspots/guidance.hpp"
#include "cie/lexer/token_view.hpp"
#include "cie/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace cie::hotspots {

    namespace {
        using NameSet = std::unordered_set<std::string_view>;

        // Callee tables, matched on the unqualified name unless noted.
        const NameSet kAllocationCalls = {
            "malloc", "calloc", "realloc", "free", "kmalloc", "kzalloc", "kcalloc", "krealloc",
            "kfree", "vmalloc", "vzalloc", "vfree", "alloc", "alloc_zeroed", "dealloc",
            "kmem_cache_alloc", "kmem_cache_free", "alloc_pages", "free_pages", "mmap", "munmap"
        };
        const NameSet kAllocationPaths = {"Box::new", "Vec::with_capacity", "String::with_capacity"};
        const NameSet kCollectionCalls = {"clone", "collect", "to_vec", "to_owned"};
        const NameSet kLockCalls = {
            "lock", "unlock", "try_lock", "read_lock", "write_lock", "spin_lock", "spin_unlock",
            "spin_lock_irqsave", "spin_unlock_irqrestore", "spin_lock_irq", "spin_unlock_irq",
            "mutex_lock", "mutex_unlock", "pthread_mutex_lock", "pthread_mutex_unlock",
            "down", "up", "down_interruptible", "sem_wait", "sem_post", "atomic_compare_exchange"
        };
        const NameSet kIoCalls = {
            "read", "write", "open", "close", "fopen", "fclose", "fread", "fwrite", "fprintf",
            "printf", "puts", "putchar", "getchar", "printk", "inb", "outb", "inw", "outw",
            "inl", "outl", "read_volatile", "write_volatile", "copy_to_user", "copy_from_user",
            "send", "recv", "serial_write", "serial_read"
        };
        const NameSet kMathCalls = {
            "pow", "powf", "powi", "sqrt", "sqrtf", "log", "exp", "sin", "cos", "tan",
            "sort", "sort_unstable", "sort_by", "sort_by_key", "qsort", "binary_search",
            "sha256", "crc32", "compress", "decompress", "encrypt", "decrypt"
        };

        // Token tables.
        const NameSet kLockTypes = {"Mutex", "RwLock", "Semaphore", "spinlock_t", "pthread_mutex_t", "SpinLock"};
        const NameSet kIoMacros = {"println", "print", "eprintln", "eprint", "write", "writeln"};
        const NameSet kCacheHostile = {
            "random_access", "pointer_chasing", "indirect_access", "scattered_access", "strided_access"
        };
        const NameSet kLinkFields = {"next", "prev", "link", "parent", "child", "left", "right"};
        const NameSet kAsmSystemCalls = {"syscall", "sysenter", "svc", "ecall", "int"};
        const NameSet kAsmLocking = {"lock", "xchg", "cmpxchg", "cmpxchg8b", "cmpxchg16b", "ldrex", "strex"};
        const NameSet kAsmIo = {"in", "out", "inb", "outb", "inw", "outw", "inl", "outl", "ins", "outs"};

        class FileRules {
        public:
            FileRules(const FileArtifacts& file, const heuristics::HeuristicsConfig& config)
                : file_(file)
                , config_(config)
                , language_(file.analysis.language)
                , tokens_(file.analysis.syntax_highlighting)
                , owners_(analysis::function_owners(file.analysis.functions, tokens_.size()))
                , loop_depths_(analysis::loop_depths(tokens_, language_)) {}

            std::vector<PerformanceHotspot> run(const std::vector<const linker::ResolvedCall*>& calls) {
                for (const auto* call : calls) {
                    apply_call_rules(*call);
                }
                for (std::size_t i = 0; i < tokens_.size(); ++i) {
                    if (owners_[i]) {
                        apply_token_rules(i);
                    }
                }
                apply_complexity_rules();
                return std::move(found_);
            }

        private:
            bool in_loop(const std::size_t i) const {
                return i < loop_depths_.size() && loop_depths_[i] > 0;
            }

            void emit(const HotspotType type, const Severity severity, const std::size_t line,
                      const std::size_t column, const std::size_t function, const char* rule) {
                if (!seen_.emplace(type, line, column).second) {
                    return;
                }
                const HotspotGuidance& guidance = guidance_for(type);

                PerformanceHotspot hotspot;
                hotspot.location = CodeLocation{file_.file_path, line, column};
                hotspot.hotspot_type = type;
                hotspot.severity = severity;
                hotspot.estimated_impact = guidance.estimated_impact;
                hotspot.description = std::string(guidance.description);
                hotspot.educational_context = std::string(guidance.educational_context);
                hotspot.optimization_potential = optimization_potential(severity);
                hotspot.function_name = file_.analysis.functions[function].name;
                hotspot.rule = rule;
                found_.push_back(std::move(hotspot));
            }

            void emit_at(const HotspotType type, const Severity severity, const std::size_t i, const char* rule) {
                emit(type, severity, tokens_[i].line, tokens_[i].start_col, *owners_[i], rule);
            }

            void apply_call_rules(const linker::ResolvedCall& call) {
                const CallSite& site = call.site;
                const std::size_t i = site.token_index;
                if (!tokens_.valid(i) || !owners_[i]) {
                    return;
                }
                const std::string_view simple = calls::simple_name(site.callee);
                const std::size_t line = site.location.line;
                const std::size_t column = site.location.column;
                const std::size_t owner = *owners_[i];

                if (site.kind == CallKind::SystemCall) {
                    emit(HotspotType::SystemCall, Severity::Critical, line, column, owner, "system_call_edge");
                }
                if (kAllocationCalls.contains(simple) || kAllocationPaths.contains(site.callee)) {
                    emit(HotspotType::MemoryAllocation, Severity::High, line, column, owner, "allocation_call");
                } else if (kCollectionCalls.contains(simple)) {
                    const Severity severity = in_loop(i) ? Severity::High : Severity::Medium;
                    emit(HotspotType::MemoryAllocation, severity, line, column, owner, "collection_copy");
                }
                if (kLockCalls.contains(simple)) {
                    const Severity severity = in_loop(i) ? escalate(Severity::High) : Severity::High;
                    emit(HotspotType::Synchronization, severity, line, column, owner, "lock_call");
                }
                if (kIoCalls.contains(simple)) {
                    emit(HotspotType::IoBound, Severity::Medium, line, column, owner, "io_call");
                }
                if (kMathCalls.contains(simple)) {
                    emit(HotspotType::CpuIntensive, Severity::Medium, line, column, owner, "math_call");
                }
            }

            void apply_token_rules(const std::size_t i) {
                const Token& token = tokens_[i];

                if (language_ == Language::Assembly) {
                    if (token.type != TokenType::Keyword) {
                        return;
                    }
                    const std::string mnemonic = string_utils::to_lower(token.value);
                    if (kAsmSystemCalls.contains(mnemonic)) {
                        emit_at(HotspotType::SystemCall, Severity::Critical, i, "trap_instruction");
                    } else if (kAsmLocking.contains(mnemonic)) {
                        emit_at(HotspotType::Synchronization, Severity::High, i, "atomic_instruction");
                    } else if (kAsmIo.contains(mnemonic)) {
                        emit_at(HotspotType::IoBound, Severity::Medium, i, "port_io");
                    }
                    return;
                }

                if (analysis::is_loop_keyword(token, language_)) {
                    if (analysis::loop_body(tokens_, i, language_)) {
                        const Severity severity = in_loop(i) ? escalate(Severity::Medium) : Severity::Medium;
                        emit_at(HotspotType::Loop, severity, i, "loop");
                    }
                    return;
                }

                if (language_ == Language::Cpp && (token.is_keyword("new") || token.is_keyword("delete"))) {
                    emit_at(HotspotType::MemoryAllocation, Severity::High, i, "new_delete");
                    return;
                }

                if (token.type != TokenType::Identifier) {
                    if (token.is_operator("->") && in_loop(i) && tokens_.is_identifier(i + 1) &&
                        kLinkFields.contains(tokens_[i + 1].value)) {
                        emit_at(HotspotType::CacheMiss, Severity::High, i + 1, "pointer_chasing");
                    }
                    return;
                }

                if (kLockTypes.contains(token.value) &&
                    (tokens_.is_operator(i + 1, "<") || tokens_.is_operator(i + 1, "::"))) {
                    const Severity severity = in_loop(i) ? escalate(Severity::High) : Severity::High;
                    emit_at(HotspotType::Synchronization, severity, i, "lock_type");
                } else if (language_ == Language::Rust && kIoMacros.contains(token.value) &&
                           tokens_.is_operator(i + 1, "!")) {
                    emit_at(HotspotType::IoBound, Severity::Medium, i, "io_macro");
                } else if (kCacheHostile.contains(token.value)) {
                    emit_at(HotspotType::CacheMiss, Severity::High, i, "cache_hostile_access");
                }
            }

            void apply_complexity_rules() {
                const auto& bands = config_.complexity;
                const auto& functions = file_.analysis.functions;
                for (std::size_t f = 0; f < functions.size(); ++f) {
                    const FunctionInfo& function = functions[f];
                    if (function.complexity > bands.high_threshold) {
                        emit(HotspotType::CpuIntensive, Severity::High, function.location.line,
                             function.location.column, f, "complexity_high");
                    } else if (function.complexity > bands.medium_threshold) {
                        emit(HotspotType::CpuIntensive, Severity::Medium, function.location.line,
                             function.location.column, f, "complexity_medium");
                    }
                }
            }

            const FileArtifacts& file_;
            const heuristics::HeuristicsConfig& config_;
            Language language_;
            lexer::TokenView tokens_;
            analysis::Owners owners_;
            std::vector<int> loop_depths_;
            std::set<std::tuple<HotspotType, std::size_t, std::size_t>> seen_;
            std::vector<PerformanceHotspot> found_;
        };
    }

    void sort_hotspots(std::vector<PerformanceHotspot>& hotspots) {
        std::ranges::stable_sort(hotspots, [](const PerformanceHotspot& a, const PerformanceHotspot& b) {
            const int rank_a = severity_rank(a.severity);
            const int rank_b = severity_rank(b.severity);
            if (rank_a != rank_b) {
                return rank_a > rank_b;
            }
            return std::tie(a.location, a.hotspot_type) < std::tie(b.location, b.hotspot_type);
        });
    }

    std::vector<OptimizationSuggestion> optimization_suggestions(const std::vector<PerformanceHotspot>& hotspots) {
        std::vector<OptimizationSuggestion> suggestions;
        suggestions.reserve(hotspots.size());

        for (const auto& hotspot : hotspots) {
            const HotspotGuidance& guidance = guidance_for(hotspot.hotspot_type);

            OptimizationSuggestion suggestion;
            suggestion.location = hotspot.location;
            suggestion.suggestion_type = std::string(guidance.suggestion_type);
            suggestion.priority = hotspot.severity;
            suggestion.description = std::string(guidance.optimization);
            suggestion.implementation_effort = std::string(guidance.implementation_effort);
            suggestion.expected_improvement = std::string(guidance.expected_improvement);
            suggestion.code_example = std::string(guidance.code_example);
            suggestion.educational_explanation = std::string(guidance.educational_explanation);
            suggestion.related_concepts.assign(guidance.related_concepts.begin(), guidance.related_concepts.end());
            suggestions.push_back(std::move(suggestion));
        }
        return suggestions;
    }

    HotspotClassifier::HotspotClassifier(const heuristics::HeuristicsConfig& config)
        : config_(config) {}

    std::vector<PerformanceHotspot> HotspotClassifier::classify_file(
        const FileArtifacts& file,
        const std::vector<const linker::ResolvedCall*>& calls) const {
        FileRules rules(file, config_);
        return rules.run(calls);
    }

    std::vector<PerformanceHotspot> HotspotClassifier::classify(const linker::LinkContext& context,
                                                                const linker::LinkedProgram& program) const {
        std::unordered_map<std::string, std::vector<const linker::ResolvedCall*>> calls_by_file;
        for (const auto& call : program.calls) {
            calls_by_file[call.site.location.file_path].push_back(&call);
        }

        std::vector<PerformanceHotspot> hotspots;
        for (const auto& file : context.files) {
            if (file->failed) {
                continue;
            }
            auto found = classify_file(*file, calls_by_file[file->file_path]);
            hotspots.insert(hotspots.end(),
                            std::make_move_iterator(found.begin()),
                            std::make_move_iterator(found.end()));
        }

        sort_hotspots(hotspots);
        spdlog::debug("Classified {} hotspots across {} files", hotspots.size(), context.files.size());
        return hotspots;
    }

}  // namespace cie::hotspots
