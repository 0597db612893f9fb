//
// Created by gregorian-rayne on 10/18/26.
//

#include "cie/lexer/lexer.hpp"
#include "cie/utils/string_utils.hpp"

#include <unordered_set>

namespace cie::lexer {

    namespace {
        using WordSet = std::unordered_set<std::string_view>;

        const WordSet& rust_keywords() {
            static const WordSet words = {
                "as", "async", "await", "break", "const", "continue", "crate", "dyn",
                "else", "enum", "extern", "false", "fn", "for", "if", "impl", "in",
                "let", "loop", "match", "mod", "move", "mut", "pub", "ref", "return",
                "self", "Self", "static", "struct", "super", "trait", "true", "type",
                "union", "unsafe", "use", "where", "while", "yield"
            };
            return words;
        }

        const WordSet& c_keywords() {
            static const WordSet words = {
                "auto", "break", "case", "char", "const", "continue", "default", "do",
                "double", "else", "enum", "extern", "float", "for", "goto", "if",
                "inline", "int", "long", "register", "restrict", "return", "short",
                "signed", "sizeof", "static", "struct", "switch", "typedef", "union",
                "unsigned", "void", "volatile", "while", "_Bool", "bool", "true", "false",
                "asm", "__asm__", "__volatile__", "__attribute__", "__inline__",
                "_Alignas", "_Alignof", "_Atomic", "_Noreturn", "_Static_assert",
                "_Thread_local"
            };
            return words;
        }

        const WordSet& cpp_only_keywords() {
            static const WordSet words = {
                "alignas", "alignof", "catch", "class", "concept", "consteval",
                "constexpr", "constinit", "const_cast", "co_await", "co_return",
                "co_yield", "decltype", "delete", "dynamic_cast", "explicit", "export",
                "final", "friend", "mutable", "namespace", "new", "noexcept", "nullptr",
                "operator", "override", "private", "protected", "public",
                "reinterpret_cast", "requires", "static_assert", "static_cast",
                "template", "this", "thread_local", "throw", "try", "typeid",
                "typename", "using", "virtual", "wchar_t", "char8_t", "char16_t",
                "char32_t"
            };
            return words;
        }

        const WordSet& assembly_mnemonics() {
            static const WordSet words = {
                // x86
                "mov", "movl", "movq", "movb", "movw", "movzx", "movsx", "lea", "leaq",
                "add", "addl", "addq", "sub", "subl", "subq", "mul", "imul", "div", "idiv",
                "inc", "dec", "neg", "and", "or", "xor", "not", "shl", "shr", "sal", "sar",
                "cmp", "cmpl", "cmpq", "test", "testl", "testq", "push", "pushq", "pop",
                "popq", "call", "callq", "ret", "retq", "jmp", "je", "jne", "jz", "jnz",
                "jl", "jle", "jg", "jge", "ja", "jae", "jb", "jbe", "js", "jns", "jo",
                "jno", "loop", "loope", "loopne", "int", "syscall", "sysenter", "sysret",
                "sysexit", "iret", "iretq", "cli", "sti", "hlt", "nop", "pushf", "popf",
                "cpuid", "rdtsc", "rdmsr", "wrmsr", "lgdt", "lidt", "ltr", "invlpg",
                "xchg", "cmpxchg", "lock", "rep", "stosb", "movsb", "in", "out", "inb",
                "outb", "enter", "leave", "cld", "std",
                // ARM / AArch64
                "b", "bl", "blr", "br", "bx", "blx", "beq", "bne", "blt", "ble", "bgt",
                "bge", "cbz", "cbnz", "tbz", "tbnz", "ldr", "str", "ldp", "stp", "ldm",
                "stm", "adr", "adrp", "svc", "eret", "wfi", "wfe", "msr", "mrs", "isb",
                "dsb", "dmb", "movz", "movk", "orr", "eor", "lsl", "lsr", "asr", "cmn",
                "b.eq", "b.ne", "b.lt", "b.le", "b.gt", "b.ge", "b.hi", "b.lo",
                // RISC-V
                "li", "la", "lw", "sw", "ld", "sd", "addi", "jal", "jalr", "beqz", "bnez",
                "ecall", "mret", "sret", "csrr", "csrw", "csrrw", "fence"
            };
            return words;
        }

        const WordSet& rust_builtin_types() {
            static const WordSet words = {
                "i8", "i16", "i32", "i64", "i128", "isize", "u8", "u16", "u32", "u64",
                "u128", "usize", "f32", "f64", "bool", "char", "str", "String"
            };
            return words;
        }

        const WordSet& c_builtin_types() {
            static const WordSet words = {
                "char", "short", "int", "long", "float", "double", "void", "signed",
                "unsigned", "_Bool", "bool", "size_t", "ssize_t", "uint8_t", "uint16_t",
                "uint32_t", "uint64_t", "int8_t", "int16_t", "int32_t", "int64_t",
                "uintptr_t", "intptr_t", "wchar_t", "auto"
            };
            return words;
        }
    }

    bool is_keyword(const Language language, const std::string_view word) {
        switch (language) {
            case Language::Rust:
                return rust_keywords().contains(word);
            case Language::Cpp:
                return c_keywords().contains(word) || cpp_only_keywords().contains(word);
            case Language::Assembly: {
                if (word.size() > 1 && word.front() == '.') {
                    return true;
                }
                const std::string lower = string_utils::to_lower(word);
                return assembly_mnemonics().contains(lower);
            }
            case Language::C:
            case Language::Unknown:
                return c_keywords().contains(word);
        }
        return false;
    }

    bool is_builtin_type(const Language language, const std::string_view word) {
        switch (language) {
            case Language::Rust:
                return rust_builtin_types().contains(word);
            case Language::C:
            case Language::Cpp:
            case Language::Unknown:
                return c_builtin_types().contains(word);
            case Language::Assembly:
                return false;
        }
        return false;
    }

}  // namespace cie::lexer
