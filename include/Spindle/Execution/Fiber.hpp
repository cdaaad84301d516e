/// @file Fiber.hpp
/// @brief Stackful fibers built on the hand-written context switch.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Execution/Config.hpp>
#include <Spindle/Execution/FiberErrors.hpp>
#include <Spindle/Execution/FiberStack.hpp>
#include <Spindle/Primitives.hpp>

#include <exception>

#if !SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS
#error "Spindle::Execution::Fiber is not available on this platform (SPINDLE_EXECUTION_HAS_STACKFUL_FIBERS == 0)."
#endif

namespace Spindle::Execution
{
    namespace detail
    {
        struct FiberControl;
    }

    class FiberPool;

    /// @brief Entry point of a fiber. Runs on the fiber's own stack.
    using FiberEntry = void (*)(void* argument);

    enum class FiberState : UInt8
    {
        Created,   ///< Ready to run its entry; never switched into since the entry was assigned.
        Running,   ///< The context this thread is executing in. At most one per thread.
        Suspended, ///< Gave up control with YieldNow()/YieldTo(), or waits inside a nested Resume().
        Terminated,///< Entry returned (or threw). The stack may be rearmed or released.
    };

    enum class SwitchOutcome : UInt8
    {
        Yielded,
        Terminated,
        Faulted,///< Terminated by an exception escaping the entry; see Fiber::TakeException.
    };

    /// @brief A cooperatively scheduled unit of execution with its own stack.
    ///
    /// @details
    /// A fiber never runs user code on construction. `Resume()` switches into it from whatever context calls it (the
    /// thread's native stack or another fiber) and returns once the fiber yields or terminates. Termination switches
    /// back to the last resumer; control never falls off the fiber's stack.
    ///
    /// Destroying a suspended fiber releases its stack without unwinding it: objects still alive on that stack are
    /// not destroyed.
    class SPINDLE_BASE_API Fiber
    {
    public:
        /// @brief An empty fiber (no stack). Only assignment and destruction are valid.
        Fiber() noexcept = default;

        /// @brief Allocates a stack and prepares `entry(argument)`. Throws AllocationError.
        Fiber(FiberEntry entry, void* argument, const FiberStackOptions& options = {});

        /// @brief Prepares `entry(argument)` on a caller-provided stack.
        [[nodiscard]] static Fiber Create(FiberStack stack, FiberEntry entry, void* argument);

        ~Fiber();

        Fiber(const Fiber&)            = delete;
        Fiber& operator=(const Fiber&) = delete;
        Fiber(Fiber&& other) noexcept;
        Fiber& operator=(Fiber&& other) noexcept;

        /// @brief Switches into the fiber until it yields or terminates.
        ///
        /// Throws ReentrancyError when the fiber is running or blocked in a nested Resume() (guarded builds), and
        /// InvalidFiberError when it is empty or terminated.
        [[nodiscard]] SwitchOutcome Resume();

        /// @brief Reuses the stack for new work.
        ///
        /// A terminated fiber is re-targeted in place with an intercept of its parked context; a created fiber is
        /// bootstrapped again from the top of its stack. Throws InvalidFiberError in any other state.
        void Rearm(FiberEntry entry, void* argument);

        [[nodiscard]] bool       IsValid() const noexcept { return m_control != nullptr; }
        explicit                 operator bool() const noexcept { return IsValid(); }
        /// @brief Lifecycle state; an empty fiber reports Terminated.
        [[nodiscard]] FiberState State() const noexcept;
        [[nodiscard]] UIntSize   StackSize() const noexcept;

        [[nodiscard]] bool               HasException() const noexcept;
        [[nodiscard]] std::exception_ptr TakeException() noexcept;

        /// @brief True when the calling thread is executing inside a fiber.
        [[nodiscard]] static bool IsInFiber() noexcept;

        /// @brief Switches from the running fiber back to whoever resumed it. Throws InvalidFiberError outside a fiber.
        static void YieldNow();

        /// @brief Transfers control from the running fiber directly into `target`.
        ///
        /// `target` takes over the caller's resumer, so its next yield or its termination returns there. The calling
        /// fiber becomes Suspended. Throws ReentrancyError for the running fiber itself or a blocked fiber and
        /// InvalidFiberError for empty or terminated targets.
        static void YieldTo(Fiber& target);

        /// @brief Ends the running fiber and continues in `target`, which takes over the resumer of `self`.
        ///
        /// `self` must own the running fiber; it is left empty. Once execution is on `target`'s stack the exited
        /// fiber is destroyed, before `target` resumes. Objects alive on the exiting stack are not destroyed. A
        /// `Resume()` still waiting on the exited fiber returns Terminated once control comes back to it.
        /// Throws InvalidFiberError when `self` is not the running fiber, and the YieldTo errors for `target`.
        [[noreturn]] static void ExitTo(Fiber&& self, Fiber& target);

        /// @brief As ExitTo, but the exited stack is released into `pool` for reuse instead of being freed.
        [[noreturn]] static void ExitToPool(Fiber&& self, Fiber& target, FiberPool& pool);

    private:
        friend class FiberPool;

        explicit Fiber(detail::FiberControl* control) noexcept;

        [[noreturn]] static void Exit(Fiber& self, Fiber& target, FiberPool* pool);
        static void              DisposeExited(detail::FiberControl* control, void* pool) noexcept;

        void                           Destroy() noexcept;
        void                           DiscardUnusedStack();
        void                           SetOwner(const FiberPool* owner) noexcept;
        [[nodiscard]] const FiberPool* Owner() const noexcept;

        detail::FiberControl* m_control {nullptr};
    };
}// namespace Spindle::Execution
