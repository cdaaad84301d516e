/// @file FiberStack.hpp
/// @brief Exclusively owned, fixed-capacity stack regions for fibers.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Primitives.hpp>

#include <concepts>

namespace Spindle::Execution
{
    inline constexpr UIntSize DEFAULT_FIBER_STACK_SIZE = 128uz * 1024uz;
    inline constexpr UIntSize FIBER_STACK_ALIGNMENT    = 16;

    /// @brief Non-owning reference to the allocator that backs heap stacks.
    ///
    /// A default-constructed reference uses the global aligned `operator new`. `Bind` adapts any object with
    /// `void* Allocate(UIntSize size, UIntSize alignment) noexcept` and
    /// `void Deallocate(void* base, UIntSize size, UIntSize alignment) noexcept`; that object must outlive every stack
    /// allocated through it. Stacks are always requested with FIBER_STACK_ALIGNMENT.
    class SPINDLE_BASE_API StackAllocatorRef final
    {
    public:
        constexpr StackAllocatorRef() noexcept = default;

        template<class A>
            requires requires(A& a, void* p, UIntSize s) {
                { a.Allocate(s, s) } -> std::convertible_to<void*>;
                a.Deallocate(p, s, s);
            }
        [[nodiscard]] static constexpr StackAllocatorRef Bind(A& allocator) noexcept
        {
            StackAllocatorRef ref;
            ref.m_target     = &allocator;
            ref.m_allocate   = &Forward<A>::Allocate;
            ref.m_deallocate = &Forward<A>::Deallocate;
            return ref;
        }

        /// @brief True when stacks come from the global aligned operator new.
        [[nodiscard]] constexpr bool IsDefault() const noexcept { return m_target == nullptr; }

        /// @brief Null when the allocator is exhausted.
        [[nodiscard]] Byte* AllocateStack(UIntSize size) const noexcept;
        void                DeallocateStack(Byte* base, UIntSize size) const noexcept;

    private:
        using AllocateHook   = void* (*)(void* target, UIntSize size) noexcept;
        using DeallocateHook = void (*)(void* target, void* base, UIntSize size) noexcept;

        template<class A>
        struct Forward
        {
            static void* Allocate(void* target, UIntSize size) noexcept
            {
                return static_cast<A*>(target)->Allocate(size, FIBER_STACK_ALIGNMENT);
            }

            static void Deallocate(void* target, void* base, UIntSize size) noexcept
            {
                static_cast<A*>(target)->Deallocate(base, size, FIBER_STACK_ALIGNMENT);
            }
        };

        void*          m_target {nullptr};
        AllocateHook   m_allocate {nullptr};
        DeallocateHook m_deallocate {nullptr};
    };

    struct FiberStackOptions final
    {
        UIntSize          stackSize {DEFAULT_FIBER_STACK_SIZE};// 0 selects DEFAULT_FIBER_STACK_SIZE
        bool              guardPages {false};                  // mmap-backed stack with PROT_NONE pages below it
        UIntSize          guardSize {0};                       // 0 = one page
        StackAllocatorRef allocator {};                        // default: aligned operator new
    };

    /// @brief Move-only owner of one fiber stack.
    ///
    /// Stacks grow down: execution starts at `Top()` and may use `Size()` bytes below it. With guard pages the
    /// region is obtained with mmap and overflowing into the guard faults; without them it comes from the allocator.
    class SPINDLE_BASE_API FiberStack
    {
    public:
        FiberStack() noexcept = default;
        ~FiberStack();

        FiberStack(const FiberStack&)            = delete;
        FiberStack& operator=(const FiberStack&) = delete;
        FiberStack(FiberStack&& other) noexcept;
        FiberStack& operator=(FiberStack&& other) noexcept;

        /// @brief Obtains a stack; throws AllocationError when memory is unavailable.
        [[nodiscard]] static FiberStack Allocate(const FiberStackOptions& options);

        /// @brief The usable size `Allocate` produces for `options` (after defaulting and page rounding).
        [[nodiscard]] static UIntSize UsableSize(const FiberStackOptions& options) noexcept;

        [[nodiscard]] bool IsValid() const noexcept { return m_base != nullptr; }
        explicit operator bool() const noexcept { return IsValid(); }

        [[nodiscard]] Byte*    Base() const noexcept { return m_base; }
        [[nodiscard]] void*    Top() const noexcept;
        [[nodiscard]] UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] bool     IsMapped() const noexcept { return m_mapped; }
        [[nodiscard]] bool     Contains(const void* address) const noexcept;

        /// @brief Hands every whole page below `liveBottom` back to the operating system.
        ///
        /// Only mmap-backed stacks are trimmed; the mapping stays valid but the contents of the discarded pages
        /// become unspecified. Memory at and above `liveBottom` is left untouched.
        void Discard(const void* liveBottom);

        void Reset() noexcept;

    private:
        Byte*             m_allocationBase {nullptr};
        UIntSize          m_allocationSize {0};
        Byte*             m_base {nullptr};
        UIntSize          m_size {0};
        StackAllocatorRef m_allocator {};
        bool              m_mapped {false};
    };

    /// @brief Soft RLIMIT_STACK of the process, or DEFAULT_FIBER_STACK_SIZE when unlimited or unknown.
    [[nodiscard]] SPINDLE_BASE_API UIntSize SystemStackSize() noexcept;

    /// @brief The system page size.
    [[nodiscard]] SPINDLE_BASE_API UIntSize PageSize() noexcept;
}// namespace Spindle::Execution
