#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Execution/Fiber.hpp>

#include <exception>

namespace Spindle::Execution::detail
{
    struct FiberControl;

    /// Disposes of a fiber that left through ExitFiber. Runs on the stack of the fiber it exited to.
    using FiberExitHandler = void (*)(FiberControl* fiber, void* context) noexcept;

    SPINDLE_BASE_LOCAL FiberControl* CreateFiberControl(FiberStack stack, FiberEntry entry, void* argument);
    SPINDLE_BASE_LOCAL void          DestroyFiberControl(FiberControl* fiber) noexcept;
    SPINDLE_BASE_LOCAL SwitchOutcome ResumeFiber(FiberControl* fiber);
    SPINDLE_BASE_LOCAL void          RearmFiber(FiberControl* fiber, FiberEntry entry, void* argument);
    SPINDLE_BASE_LOCAL void          YieldFiber();
    SPINDLE_BASE_LOCAL void          YieldToFiber(FiberControl* target);
    SPINDLE_BASE_LOCAL void          CheckExit(const FiberControl* self, const FiberControl* target);
    [[noreturn]] SPINDLE_BASE_LOCAL void ExitFiber(FiberControl* self, FiberControl* target, FiberExitHandler handler,
                                                   void* context) noexcept;
    SPINDLE_BASE_LOCAL bool          IsInFiber() noexcept;
    SPINDLE_BASE_LOCAL FiberState    GetFiberState(const FiberControl* fiber) noexcept;
    SPINDLE_BASE_LOCAL UIntSize      FiberStackSize(const FiberControl* fiber) noexcept;
    SPINDLE_BASE_LOCAL void          DiscardFiberStack(FiberControl* fiber);
    SPINDLE_BASE_LOCAL void          SetFiberOwner(FiberControl* fiber, const FiberPool* owner) noexcept;
    SPINDLE_BASE_LOCAL const FiberPool* FiberOwner(const FiberControl* fiber) noexcept;
    SPINDLE_BASE_LOCAL bool          FiberHasException(const FiberControl* fiber) noexcept;
    SPINDLE_BASE_LOCAL std::exception_ptr FiberTakeException(FiberControl* fiber) noexcept;
}// namespace Spindle::Execution::detail
