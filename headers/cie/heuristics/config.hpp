//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_HEURISTICS_CONFIG_HPP
#define CIE_HEURISTICS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Heuristic tables and thresholds for the analysis pipeline.
 *
 * These are the read-only tables shared by every Stage 1 worker and by the
 * linker. The defaults target kernel-style code: interrupt registration,
 * scheduler primitives and syscall dispatch helpers are treated as
 * system-call-like, and entry points follow process/task/module-init naming.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace cie::heuristics
{
    /**
     * @brief Complexity bands.
     *
     * A function above medium_threshold is a moderately complex unit, above
     * high_threshold a hard-to-follow one. The bands drive node impact and
     * the cpu_intensive hotspot rule.
     */
    struct ComplexityConfig {
        int medium_threshold = 10;
        int high_threshold = 20;
    };

    /**
     * @brief Call-site classification tables.
     */
    struct CallConfig {
        /// Callee names treated as kernel primitives (matched on the unqualified name)
        std::vector<std::string> system_call_names = {
            // interrupt registration
            "request_irq", "free_irq", "request_threaded_irq", "enable_irq", "disable_irq",
            "register_interrupt_handler", "register_irq_handler", "set_irq_handler",
            "set_interrupt_handler", "idt_set_gate", "set_intr_gate",
            // scheduler primitives
            "schedule", "schedule_timeout", "yield_now", "sched_yield", "wake_up",
            "wake_up_process", "context_switch", "switch_to",
            // syscall dispatch
            "syscall", "do_syscall", "syscall_dispatch", "dispatch_syscall",
            "handle_syscall", "system_call"
        };

        /// Names that look like calls but are constructors of language-level wrappers
        std::vector<std::string> ignored_callees = {"Some", "Ok", "Err"};
    };

    /**
     * @brief Global linking parameters.
     */
    struct LinkerConfig {
        /// ECMAScript regular expressions matched against the unqualified name
        std::vector<std::string> entry_point_patterns = {
            "^main$", "^_start$", "^kernel_main$", "^start_kernel$", "^kmain$",
            "^init$", "^init_.*", ".*_init$", "^module_init$",
            "^task_.*", ".*_task$", "^process_.*", ".*_entry$"
        };

        /// Outgoing call total above which a node's impact is raised to high
        std::size_t large_call_count = 10;
    };

    /**
     * @brief Aggregated heuristics.
     */
    struct HeuristicsConfig {
        ComplexityConfig complexity;
        CallConfig calls;
        LinkerConfig linker;

        static HeuristicsConfig defaults() {
            return HeuristicsConfig{};
        }
    };

}  // namespace cie::heuristics

#endif //CIE_HEURISTICS_CONFIG_HPP
