/// @file FiberContext.hpp
/// @brief Internal context switching primitives for stackful fibers.
///
/// Three transfers are implemented per architecture in FiberContext.<arch>.cpp:
///  - ContextStart     prepares a never-run context so the first switch into it calls `entry(argument)` on a fresh stack;
///  - SwitchContext    saves the caller into `from` and continues wherever `to` was saved;
///  - ContextIntercept makes the next switch into a suspended context call `entry(argument)` first, which then returns
///                     into the original suspension point as if that point had been resumed normally.
///
/// None of them allocate or fail. Passing a context that was not produced by these routines, or a stack too small
/// for the code that runs on it, is undefined behavior.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Execution/Config.hpp>
#include <Spindle/Primitives.hpp>

#include <cstdint>

namespace Spindle::Execution::detail
{
    using ContextEntry = void (*)(void*);

    struct FiberContext final
    {
#if defined(__x86_64__)
        std::uint64_t rsp {0};
        std::uint64_t rip {0};
        std::uint64_t rbx {0};
        std::uint64_t rbp {0};
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
        std::uint64_t r12 {0};
        std::uint64_t r13 {0};
        std::uint64_t r14 {0};
        std::uint64_t r15 {0};
#endif
#elif defined(__aarch64__)
        std::uint64_t sp {0};
        std::uint64_t pc {0};
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
        std::uint64_t x19 {0};
        std::uint64_t x20 {0};
        std::uint64_t x21 {0};
        std::uint64_t x22 {0};
        std::uint64_t x23 {0};
        std::uint64_t x24 {0};
        std::uint64_t x25 {0};
        std::uint64_t x26 {0};
        std::uint64_t x27 {0};
        std::uint64_t x28 {0};
        std::uint64_t x29 {0};
#else
        std::uint64_t x19 {0};
        std::uint64_t x29 {0};
#endif
#else
#error "FiberContext is not implemented for this architecture."
#endif
    };

    extern "C"
    {
        SPINDLE_BASE_LOCAL void Spindle_FiberContextSwitch(FiberContext* from, const FiberContext* to) noexcept;
        SPINDLE_BASE_LOCAL void Spindle_FiberContextStart() noexcept;
        SPINDLE_BASE_LOCAL void Spindle_FiberContextIntercept() noexcept;
    }

    /// @brief Initializes `context` to run `entry(argument)` on the stack ending at `stackTop`.
    /// `entry` must never return: its return address is poisoned so returning faults.
    SPINDLE_BASE_LOCAL void ContextStart(FiberContext& context, void* stackTop, ContextEntry entry, void* argument) noexcept;

    /// @brief Re-targets a suspended `context`. May be applied repeatedly before the next switch; the most recent
    /// intercept runs first and each one returns into the previous.
    SPINDLE_BASE_LOCAL void ContextIntercept(FiberContext& context, ContextEntry entry, void* argument) noexcept;

    /// @brief Stack pointer a suspended context will resume with. Everything below it is unused.
    [[nodiscard]] SPINDLE_BASE_LOCAL const void* ContextStackPointer(const FiberContext& context) noexcept;

    /// @brief Saves the calling context into `from` and resumes `to`.
    ///
    /// Returns once another switch resumes `from`. Registers outside the saved layout are declared clobbered so the
    /// compiler treats this exactly like a call to an opaque function; floating-point and vector state is never saved.
    SPINDLE_ALWAYS_INLINE void SwitchContext(FiberContext* from, const FiberContext* to) noexcept
    {
#if defined(__x86_64__)
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
        // SysV has no callee-saved vector registers, so a plain call already has the right clobber set.
        Spindle_FiberContextSwitch(from, to);
#else
        // Steps over the red zone and aligns the stack so the suspended stack pointer is 16-byte aligned.
        FiberContext*       rdi = from;
        const FiberContext* rsi = to;
        asm volatile(
                "movq %%rsp, %%rcx\n\t"
                "leaq -128(%%rsp), %%rsp\n\t"
                "andq $-16, %%rsp\n\t"
                "pushq %%rcx\n\t"
                "subq $8, %%rsp\n\t"
                "call Spindle_FiberContextSwitch\n\t"
                "addq $8, %%rsp\n\t"
                "popq %%rsp\n\t"
                : "+D"(rdi), "+S"(rsi)
                :
                : "rax", "rcx", "rdx", "r8", "r9", "r10", "r11", "r12", "r13", "r14", "r15",
                  "xmm0", "xmm1", "xmm2", "xmm3", "xmm4", "xmm5", "xmm6", "xmm7",
                  "xmm8", "xmm9", "xmm10", "xmm11", "xmm12", "xmm13", "xmm14", "xmm15",
#if defined(__AVX512F__)
                  "xmm16", "xmm17", "xmm18", "xmm19", "xmm20", "xmm21", "xmm22", "xmm23",
                  "xmm24", "xmm25", "xmm26", "xmm27", "xmm28", "xmm29", "xmm30", "xmm31",
                  "k1", "k2", "k3", "k4", "k5", "k6", "k7",
#endif
                  "st", "st(1)", "st(2)", "st(3)", "st(4)", "st(5)", "st(6)", "st(7)",
                  "cc", "memory");
#endif
#elif defined(__aarch64__)
        // AAPCS64 treats d8-d15 as callee-saved; declaring every vector register clobbered makes the compiler
        // spill the ones it needs instead of the switch saving them unconditionally.
        register FiberContext*       x0 asm("x0") = from;
        register const FiberContext* x1 asm("x1") = to;
        asm volatile(
                "bl Spindle_FiberContextSwitch\n\t"
                : "+r"(x0), "+r"(x1)
                :
                : "x2", "x3", "x4", "x5", "x6", "x7", "x8", "x9", "x10", "x11", "x12", "x13", "x14", "x15",
                  "x16", "x17", "x18",
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_MINIMAL
                  "x20", "x21", "x22", "x23", "x24", "x25", "x26", "x27", "x28",
#endif
                  "x30",
                  "v0", "v1", "v2", "v3", "v4", "v5", "v6", "v7", "v8", "v9", "v10", "v11", "v12", "v13", "v14", "v15",
                  "v16", "v17", "v18", "v19", "v20", "v21", "v22", "v23", "v24", "v25", "v26", "v27", "v28", "v29",
                  "v30", "v31",
                  "cc", "memory");
#endif
    }
}// namespace Spindle::Execution::detail
