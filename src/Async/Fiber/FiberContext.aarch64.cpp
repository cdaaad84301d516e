/// @file FiberContext.aarch64.cpp
/// @brief AArch64 AAPCS64 context switch implementation (internal).
///
/// The resume address is kept in the `pc` slot and lands in x30 before the branch, so a context resumes exactly like
/// a `ret` from the `bl` that suspended it.
///
///   start      sp -> [entry][argument]                    stack top
///   intercept  sp -> [entry][argument][return][unused]    previous sp
///
/// The stubs pop their record before branching, leaving sp 16-byte aligned at entry. `start` clears x30 so returning
/// from the entry function faults; `intercept` loads x30 with the previous resume address.

#include "FiberContext.hpp"

#include <cstddef>
#include <new>

#if defined(__aarch64__)

namespace Spindle::Execution::detail
{
    static_assert(offsetof(FiberContext, sp) == 0);
    static_assert(offsetof(FiberContext, pc) == 8);
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
    static_assert(sizeof(FiberContext) == 104);
    static_assert(offsetof(FiberContext, x19) == 16);
    static_assert(offsetof(FiberContext, x20) == 24);
    static_assert(offsetof(FiberContext, x21) == 32);
    static_assert(offsetof(FiberContext, x22) == 40);
    static_assert(offsetof(FiberContext, x23) == 48);
    static_assert(offsetof(FiberContext, x24) == 56);
    static_assert(offsetof(FiberContext, x25) == 64);
    static_assert(offsetof(FiberContext, x26) == 72);
    static_assert(offsetof(FiberContext, x27) == 80);
    static_assert(offsetof(FiberContext, x28) == 88);
    static_assert(offsetof(FiberContext, x29) == 96);
#else
    static_assert(sizeof(FiberContext) == 32);
    static_assert(offsetof(FiberContext, x19) == 16);
    static_assert(offsetof(FiberContext, x29) == 24);
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
            std::uint64_t returnAddress;
            std::uint64_t unused;
        };

        static_assert(sizeof(StartRecord) == 16);
        static_assert(sizeof(InterceptRecord) == 32);
    }// namespace

    void ContextStart(FiberContext& context, void* stackTop, ContextEntry entry, void* argument) noexcept
    {
        const auto top    = reinterpret_cast<UIntPtr>(stackTop) & ~UIntPtr {15};
        auto*      record = ::new (reinterpret_cast<void*>(top - sizeof(StartRecord))) StartRecord {entry, argument};

        context    = FiberContext {};
        context.sp = reinterpret_cast<std::uint64_t>(record);
        context.pc = reinterpret_cast<std::uint64_t>(&Spindle_FiberContextStart);
    }

    void ContextIntercept(FiberContext& context, ContextEntry entry, void* argument) noexcept
    {
        auto* record = ::new (reinterpret_cast<void*>(context.sp - sizeof(InterceptRecord)))
                InterceptRecord {entry, argument, context.pc, 0};

        context.sp = reinterpret_cast<std::uint64_t>(record);
        context.pc = reinterpret_cast<std::uint64_t>(&Spindle_FiberContextIntercept);
    }

    const void* ContextStackPointer(const FiberContext& context) noexcept
    {
        return reinterpret_cast<const void*>(context.sp);
    }
}// namespace Spindle::Execution::detail

#if defined(__GNUC__) || defined(__clang__)
asm(R"(
.text

.globl Spindle_FiberContextSwitch
.hidden Spindle_FiberContextSwitch
.type Spindle_FiberContextSwitch, %function
.p2align 4
Spindle_FiberContextSwitch:
    mov x9, sp
    stp x9, x30, [x0, #0]
)"
#if SPINDLE_FIBER_CONTEXT_LAYOUT == SPINDLE_FIBER_CONTEXT_LAYOUT_FULL
    R"(
    stp x19, x20, [x0, #16]
    stp x21, x22, [x0, #32]
    stp x23, x24, [x0, #48]
    stp x25, x26, [x0, #64]
    stp x27, x28, [x0, #80]
    str x29, [x0, #96]

    ldp x19, x20, [x1, #16]
    ldp x21, x22, [x1, #32]
    ldp x23, x24, [x1, #48]
    ldp x25, x26, [x1, #64]
    ldp x27, x28, [x1, #80]
    ldr x29, [x1, #96]
)"
#else
    R"(
    stp x19, x29, [x0, #16]
    ldp x19, x29, [x1, #16]
)"
#endif
    R"(
    ldp x9, x30, [x1, #0]
    mov sp, x9
    br x30
.size Spindle_FiberContextSwitch, .-Spindle_FiberContextSwitch

.globl Spindle_FiberContextStart
.hidden Spindle_FiberContextStart
.type Spindle_FiberContextStart, %function
.p2align 4
Spindle_FiberContextStart:
    ldp x9, x0, [sp], #16
    mov x30, xzr
    br x9
.size Spindle_FiberContextStart, .-Spindle_FiberContextStart

.globl Spindle_FiberContextIntercept
.hidden Spindle_FiberContextIntercept
.type Spindle_FiberContextIntercept, %function
.p2align 4
Spindle_FiberContextIntercept:
    ldp x9, x0, [sp]
    ldr x30, [sp, #16]
    add sp, sp, #32
    br x9
.size Spindle_FiberContextIntercept, .-Spindle_FiberContextIntercept
)");
#endif

#endif
