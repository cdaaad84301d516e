/// @file FiberContext.x86_64.cpp
/// @brief x86_64 SysV context switch implementation (internal).
///
/// Stack conventions (addresses grow upward in the diagrams):
///
///   start      rsp -> [entry][argument]              stack top (16-byte aligned)
///              the stub loads both, moves rsp up one slot and overwrites it with 0, so `entry` begins with
///              rsp % 16 == 8 and a return address that faults.
///
///   intercept  rsp -> [entry][argument][unused][return]   previous rsp (16-byte aligned)
///              the stub loads entry/argument and moves rsp onto `return`, so `entry` begins exactly as if called
///              from the previous resume address; its `ret` lands there with the previous rsp.
///
/// Both records live at or above the stack pointer the switch restores, so nothing running on that stack
/// (including a signal handler) can overwrite them before the stub consumes them.

#include "FiberContext.hpp"

#include <cstddef>
#include <new>

#if defined(__x86_64__)

namespace Spindle::Execution::detail
{
    static_assert(offsetof(FiberContext, rsp) == 0);
    static_assert(offsetof(FiberContext, rip) == 8);
    static_assert(offsetof(FiberContext, rbx) == 16);
    static_assert(offsetof(FiberContext, rbp) == 24);
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
    static_assert(sizeof(FiberContext) == 64);
    static_assert(offsetof(FiberContext, r12) == 32);
    static_assert(offsetof(FiberContext, r13) == 40);
    static_assert(offsetof(FiberContext, r14) == 48);
    static_assert(offsetof(FiberContext, r15) == 56);
#else
    static_assert(sizeof(FiberContext) == 32);
#endif

    namespace
    {
        struct StartRecord final
        {
            ContextEntry entry;
            void*        argument;
        };

        struct InterceptRecord final
        {
            ContextEntry  entry;
            void*         argument;
            std::uint64_t unused;
            std::uint64_t returnAddress;
        };

        static_assert(sizeof(StartRecord) == 16);
        static_assert(sizeof(InterceptRecord) == 32);
    }// namespace

    void ContextStart(FiberContext& context, void* stackTop, ContextEntry entry, void* argument) noexcept
    {
        const auto top    = reinterpret_cast<UIntPtr>(stackTop) & ~UIntPtr {15};
        auto*      record = ::new (reinterpret_cast<void*>(top - sizeof(StartRecord))) StartRecord {entry, argument};

        context     = FiberContext {};
        context.rsp = reinterpret_cast<std::uint64_t>(record);
        context.rip = reinterpret_cast<std::uint64_t>(&Spindle_FiberContextStart);
    }

    void ContextIntercept(FiberContext& context, ContextEntry entry, void* argument) noexcept
    {
        auto* record = ::new (reinterpret_cast<void*>(context.rsp - sizeof(InterceptRecord)))
                InterceptRecord {entry, argument, 0, context.rip};

        context.rsp = reinterpret_cast<std::uint64_t>(record);
        context.rip = reinterpret_cast<std::uint64_t>(&Spindle_FiberContextIntercept);
    }

    const void* ContextStackPointer(const FiberContext& context) noexcept
    {
        return reinterpret_cast<const void*>(context.rsp);
    }
}// namespace Spindle::Execution::detail

#if defined(__GNUC__) || defined(__clang__)
asm(R"(
.text

.globl Spindle_FiberContextSwitch
.hidden Spindle_FiberContextSwitch
.type Spindle_FiberContextSwitch, @function
.p2align 4
Spindle_FiberContextSwitch:
    movq (%rsp), %rax
    leaq 8(%rsp), %rdx
    movq %rdx, 0(%rdi)
    movq %rax, 8(%rdi)
    movq %rbx, 16(%rdi)
    movq %rbp, 24(%rdi)
)"
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
    R"(
    movq %r12, 32(%rdi)
    movq %r13, 40(%rdi)
    movq %r14, 48(%rdi)
    movq %r15, 56(%rdi)

    movq 32(%rsi), %r12
    movq 40(%rsi), %r13
    movq 48(%rsi), %r14
    movq 56(%rsi), %r15
)"
#endif
    R"(
    movq 16(%rsi), %rbx
    movq 24(%rsi), %rbp
    movq 8(%rsi), %rax
    movq 0(%rsi), %rsp
    jmp *%rax
.size Spindle_FiberContextSwitch, .-Spindle_FiberContextSwitch

.globl Spindle_FiberContextStart
.hidden Spindle_FiberContextStart
.type Spindle_FiberContextStart, @function
.p2align 4
Spindle_FiberContextStart:
    movq 0(%rsp), %rax
    movq 8(%rsp), %rdi
    addq $8, %rsp
    movq $0, (%rsp)
    jmp *%rax
.size Spindle_FiberContextStart, .-Spindle_FiberContextStart

.globl Spindle_FiberContextIntercept
.hidden Spindle_FiberContextIntercept
.type Spindle_FiberContextIntercept, @function
.p2align 4
Spindle_FiberContextIntercept:
    movq 0(%rsp), %rax
    movq 8(%rsp), %rdi
    addq $24, %rsp
    jmp *%rax
.size Spindle_FiberContextIntercept, .-Spindle_FiberContextIntercept
)");
#endif

#endif
