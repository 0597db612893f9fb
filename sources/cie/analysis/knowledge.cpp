//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/analysis/knowledge.hpp"

#include <unordered_map>

namespace cie::analysis {

    const ExplanationEntry& explanation_for(const ExplanationCategory category) {
        static const ExplanationEntry system_call{
            "System call - transfers control to the kernel to perform privileged operations",
            ComplexityLevel::Intermediate,
            {"kernel", "privileged operations", "system interface"}
        };
        static const ExplanationEntry memory{
            "Memory management operation - allocates, frees or maps memory regions",
            ComplexityLevel::Advanced,
            {"virtual memory", "page tables", "memory allocation"}
        };
        static const ExplanationEntry interrupt{
            "Interrupt handling - asynchronous signal from hardware or software requiring immediate attention",
            ComplexityLevel::Advanced,
            {"interrupt controller", "context switching", "hardware signals"}
        };
        static const ExplanationEntry context_switch{
            "Context switch - saves current process state and loads new process state for multitasking",
            ComplexityLevel::Expert,
            {"process scheduling", "CPU registers", "task state"}
        };
        static const ExplanationEntry locking{
            "Locking primitive - serializes access to shared data between concurrent contexts",
            ComplexityLevel::Intermediate,
            {"mutual exclusion", "race conditions", "deadlock"}
        };
        static const ExplanationEntry unsafe_code{
            "Unsafe or raw-pointer code - the compiler no longer checks memory safety here",
            ComplexityLevel::Advanced,
            {"memory safety", "raw pointers", "undefined behavior"}
        };

        switch (category) {
            case ExplanationCategory::SystemCall:        return system_call;
            case ExplanationCategory::MemoryManagement:  return memory;
            case ExplanationCategory::InterruptHandling: return interrupt;
            case ExplanationCategory::ContextSwitch:     return context_switch;
            case ExplanationCategory::Locking:           return locking;
            case ExplanationCategory::UnsafeCode:        return unsafe_code;
        }
        return system_call;
    }

    std::optional<std::string> function_description(const std::string_view simple_name) {
        static const std::unordered_map<std::string_view, std::string_view> descriptions = {
            {"main", "Main entry point - initializes kernel and starts system services"},
            {"kernel_main", "Kernel entry point - first high-level code run after the boot loader hands over"},
            {"_start", "Program start symbol - sets up the stack before any high-level code runs"},
            {"syscall_handler", "System call handler - processes user requests for kernel services"},
            {"interrupt_handler", "Interrupt handler - responds to hardware and software interrupts"},
            {"memory_allocate", "Memory allocator - manages dynamic memory allocation in the kernel"},
            {"process_sched", "Process scheduler - determines which process runs next on CPU"},
            {"schedule", "Scheduler entry - picks the next runnable task and switches to it"},
            {"context_switch", "Context switcher - saves and restores process execution state"},
            {"page_fault_handler", "Page fault handler - resolves accesses to unmapped or protected pages"}
        };

        const auto it = descriptions.find(simple_name);
        if (it == descriptions.end()) {
            return std::nullopt;
        }
        return std::string(it->second);
    }

}  // namespace cie::analysis
