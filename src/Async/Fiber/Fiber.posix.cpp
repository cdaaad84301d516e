#include "FiberPlatform.hpp"
#include "FiberContext.hpp"

#include <Spindle/Log/Log.hpp>

#include <exception>
#include <new>
#include <string>
#include <utility>

namespace Spindle::Execution::detail
{
    // The suspended caller of ResumeFiber. Lives on the caller's stack until the switch back returns.
    struct ResumeFrame
    {
        FiberContext  context {};
        FiberControl* resumed {nullptr};// cleared when that fiber exits and its control block goes away
        ResumeFrame*  next {nullptr};   // next frame waiting on the same fiber
    };

    struct FiberControl
    {
        FiberContext       context {};
        ResumeFrame*       completion {nullptr};// where the fiber goes when it yields or terminates
        FiberControl*      resumer {nullptr};   // fiber that owns `completion`, null for a native thread stack
        ResumeFrame*       waiting {nullptr};   // frames whose `resumed` is this fiber
        FiberStack         stack {};
        FiberEntry         entry {nullptr};
        void*              argument {nullptr};
        std::exception_ptr exception;
        const FiberPool*   owner {nullptr};// pool that handed this fiber out
        FiberExitHandler   exitHandler {nullptr};
        void*              exitContext {nullptr};
        FiberState         state {FiberState::Created};
        bool               blocked {false};// suspended inside a nested ResumeFiber
        bool               exited {false}; // left through ExitFiber; the stack holds no frame worth keeping
    };

    namespace
    {
        // Only read or written before a switch, never after one returns.
        thread_local FiberControl* currentFiber = nullptr;

        void RunEntry(void* raw) noexcept
        {
            auto* fiber = static_cast<FiberControl*>(raw);
            try
            {
                fiber->entry(fiber->argument);
                fiber->exception = nullptr;
            } catch (...)
            {
                fiber->exception = std::current_exception();
            }
        }

        SPINDLE_NOINLINE void ParkTerminated(FiberControl* fiber) noexcept
        {
            fiber->state            = FiberState::Terminated;
            ResumeFrame* completion = std::exchange(fiber->completion, nullptr);
            currentFiber            = std::exchange(fiber->resumer, nullptr);
            SwitchContext(&fiber->context, &completion->context);
            // Reached only through an intercept installed by RearmFiber, once the new entry has returned.
        }

        [[noreturn]] void FiberMain(void* raw) noexcept
        {
            auto* fiber = static_cast<FiberControl*>(raw);
            RunEntry(fiber);
            for (;;)
            {
                ParkTerminated(fiber);
            }
        }

        [[nodiscard]] bool HoldsControl(const FiberControl* fiber) noexcept
        {
            return fiber->state == FiberState::Running || fiber->blocked;
        }

        void StopWaiting(FiberControl* fiber, ResumeFrame* frame) noexcept
        {
            for (ResumeFrame** link = &fiber->waiting; *link != nullptr; link = &(*link)->next)
            {
                if (*link == frame)
                {
                    *link = frame->next;
                    return;
                }
            }
        }

        void CheckTransferTarget(const FiberControl* self, const FiberControl* target, const char* operation)
        {
            if (target->state == FiberState::Terminated)
            {
                throw InvalidFiberError(std::string(operation) + ": the target has terminated");
            }
#if SPINDLE_FIBER_REENTRANCY_CHECKS
            if (target == self)
            {
                throw ReentrancyError(std::string(operation) + ": a fiber cannot transfer to itself");
            }
            if (HoldsControl(target))
            {
                throw ReentrancyError(std::string(operation) + ": the target is running or waiting in a nested resume");
            }
#else
            (void) self;
#endif
        }

        // Intercept entry on the target's stack: the exited fiber's stack is no longer in use.
        void DisposeExited(void* raw) noexcept
        {
            auto* fiber = static_cast<FiberControl*>(raw);
            fiber->exitHandler(fiber, fiber->exitContext);
        }
    }// namespace

    FiberControl* CreateFiberControl(FiberStack stack, FiberEntry entry, void* argument)
    {
        if (entry == nullptr)
        {
            throw InvalidFiberError("Fiber requires an entry function");
        }
        if (!stack)
        {
            throw InvalidFiberError("Fiber requires a stack");
        }

        auto* fiber = new (std::nothrow) FiberControl {};
        if (!fiber)
        {
            throw AllocationError("Fiber: control block allocation failed", sizeof(FiberControl));
        }

        fiber->stack    = std::move(stack);
        fiber->entry    = entry;
        fiber->argument = argument;
        ContextStart(fiber->context, fiber->stack.Top(), &FiberMain, fiber);
        return fiber;
    }

    void DestroyFiberControl(FiberControl* fiber) noexcept
    {
        if (!fiber)
        {
            return;
        }
        if (HoldsControl(fiber))
        {
            // The stack being released is live: some context would return into freed memory.
            Log::Write(Log::Level::Error, "fiber", "destroying a fiber that is running or waiting in a nested resume");
            std::terminate();
        }
        for (ResumeFrame* frame = fiber->waiting; frame != nullptr; frame = frame->next)
        {
            frame->resumed = nullptr;
        }
        delete fiber;
    }

    SwitchOutcome ResumeFiber(FiberControl* fiber)
    {
        if (fiber->state == FiberState::Terminated)
        {
            throw InvalidFiberError("Fiber::Resume: the fiber has terminated");
        }
#if SPINDLE_FIBER_REENTRANCY_CHECKS
        if (fiber->state == FiberState::Running)
        {
            throw ReentrancyError("Fiber::Resume: the fiber is already running");
        }
        if (fiber->blocked)
        {
            throw ReentrancyError("Fiber::Resume: the fiber is waiting in a nested resume");
        }
#endif

        FiberControl* previous = currentFiber;
        ResumeFrame   caller {.resumed = fiber, .next = fiber->waiting};

        fiber->waiting    = &caller;
        fiber->completion = &caller;
        fiber->resumer    = previous;
        fiber->state      = FiberState::Running;
        if (previous)
        {
            previous->state   = FiberState::Suspended;
            previous->blocked = true;
        }
        currentFiber = fiber;

        SwitchContext(&caller.context, &fiber->context);

        if (previous)
        {
            previous->blocked = false;
            previous->state   = FiberState::Running;
        }

        if (caller.resumed == nullptr)
        {
            // The fiber left through ExitFiber and no longer exists.
            return SwitchOutcome::Terminated;
        }
        StopWaiting(fiber, &caller);

        if (fiber->state != FiberState::Terminated)
        {
            return SwitchOutcome::Yielded;
        }
        return fiber->exception ? SwitchOutcome::Faulted : SwitchOutcome::Terminated;
    }

    void RearmFiber(FiberControl* fiber, FiberEntry entry, void* argument)
    {
        if (entry == nullptr)
        {
            throw InvalidFiberError("Fiber::Rearm requires an entry function");
        }

        switch (fiber->state)
        {
            case FiberState::Terminated:
                if (fiber->exited)
                {
                    ContextStart(fiber->context, fiber->stack.Top(), &FiberMain, fiber);
                    break;
                }
                // The context is parked in ParkTerminated; the new entry runs on top of that frame and returns into it.
                ContextIntercept(fiber->context, &RunEntry, fiber);
                break;
            case FiberState::Created:
                ContextStart(fiber->context, fiber->stack.Top(), &FiberMain, fiber);
                break;
            default:
                throw InvalidFiberError("Fiber::Rearm requires a created or terminated fiber");
        }

        fiber->entry     = entry;
        fiber->argument  = argument;
        fiber->exception = nullptr;
        fiber->state     = FiberState::Created;
        fiber->exited    = false;
    }

    void YieldFiber()
    {
        FiberControl* self = currentFiber;
        if (self == nullptr)
        {
            throw InvalidFiberError("Fiber::YieldNow called outside of a fiber");
        }

        ResumeFrame* completion = std::exchange(self->completion, nullptr);
        self->state             = FiberState::Suspended;
        currentFiber            = std::exchange(self->resumer, nullptr);
        SwitchContext(&self->context, &completion->context);
    }

    void YieldToFiber(FiberControl* target)
    {
        FiberControl* self = currentFiber;
        if (self == nullptr)
        {
            throw InvalidFiberError("Fiber::YieldTo called outside of a fiber");
        }
        CheckTransferTarget(self, target, "Fiber::YieldTo");

        target->completion = std::exchange(self->completion, nullptr);
        target->resumer    = std::exchange(self->resumer, nullptr);
        target->state      = FiberState::Running;
        self->state        = FiberState::Suspended;
        currentFiber       = target;
        SwitchContext(&self->context, &target->context);
    }

    void CheckExit(const FiberControl* self, const FiberControl* target)
    {
        if (currentFiber == nullptr)
        {
            throw InvalidFiberError("Fiber::ExitTo called outside of a fiber");
        }
        if (self != currentFiber)
        {
            throw InvalidFiberError("Fiber::ExitTo must be given the handle of the running fiber");
        }
        if (target == self)
        {
            throw InvalidFiberError("Fiber::ExitTo: a fiber cannot exit into itself");
        }
        CheckTransferTarget(self, target, "Fiber::ExitTo");
    }

    void ExitFiber(FiberControl* self, FiberControl* target, FiberExitHandler handler, void* context) noexcept
    {
        self->state       = FiberState::Terminated;
        self->exited      = true;
        self->exitHandler = handler;
        self->exitContext = context;
        for (ResumeFrame* frame = std::exchange(self->waiting, nullptr); frame != nullptr; frame = frame->next)
        {
            frame->resumed = nullptr;
        }

        target->completion = std::exchange(self->completion, nullptr);
        target->resumer    = std::exchange(self->resumer, nullptr);
        target->state      = FiberState::Running;
        currentFiber       = target;

        // Runs on the target's stack before it continues, once nothing executes on ours.
        ContextIntercept(target->context, &DisposeExited, self);
        SwitchContext(&self->context, &target->context);

        // The handler destroyed this stack or pooled it; a pooled stack restarts from its top through RearmFiber.
        Unreachable();
    }

    bool IsInFiber() noexcept
    {
        return currentFiber != nullptr;
    }

    FiberState GetFiberState(const FiberControl* fiber) noexcept
    {
        return fiber->state;
    }

    UIntSize FiberStackSize(const FiberControl* fiber) noexcept
    {
        return fiber->stack.Size();
    }

    void DiscardFiberStack(FiberControl* fiber)
    {
        if (fiber->state != FiberState::Created && fiber->state != FiberState::Terminated)
        {
            return;
        }
        // An exited stack only holds the frames of the code that called ExitFiber.
        fiber->stack.Discard(fiber->exited ? fiber->stack.Top() : ContextStackPointer(fiber->context));
    }

    void SetFiberOwner(FiberControl* fiber, const FiberPool* owner) noexcept
    {
        fiber->owner = owner;
    }

    const FiberPool* FiberOwner(const FiberControl* fiber) noexcept
    {
        return fiber->owner;
    }

    bool FiberHasException(const FiberControl* fiber) noexcept
    {
        return static_cast<bool>(fiber->exception);
    }

    std::exception_ptr FiberTakeException(FiberControl* fiber) noexcept
    {
        return std::exchange(fiber->exception, nullptr);
    }
}// namespace Spindle::Execution::detail
