#include <Spindle/Execution/Fiber.hpp>

#include <Spindle/Execution/FiberPool.hpp>

#include "FiberPlatform.hpp"

#include <string>
#include <utility>

namespace Spindle::Execution
{
    namespace
    {
        [[noreturn]] void ThrowEmptyFiber(const char* operation)
        {
            throw InvalidFiberError(std::string("Spindle::Execution::Fiber::") + operation + ": the fiber is empty");
        }
    }// namespace

    Fiber::Fiber(FiberEntry entry, void* argument, const FiberStackOptions& options)
    {
        if (entry == nullptr)
        {
            throw InvalidFiberError("Spindle::Execution::Fiber requires an entry function");
        }
        m_control = detail::CreateFiberControl(FiberStack::Allocate(options), entry, argument);
    }

    Fiber::Fiber(detail::FiberControl* control) noexcept
        : m_control(control)
    {
    }

    Fiber Fiber::Create(FiberStack stack, FiberEntry entry, void* argument)
    {
        return Fiber(detail::CreateFiberControl(std::move(stack), entry, argument));
    }

    Fiber::~Fiber()
    {
        Destroy();
    }

    Fiber::Fiber(Fiber&& other) noexcept
        : m_control(std::exchange(other.m_control, nullptr))
    {
    }

    Fiber& Fiber::operator=(Fiber&& other) noexcept
    {
        if (this != &other)
        {
            Destroy();
            m_control = std::exchange(other.m_control, nullptr);
        }
        return *this;
    }

    void Fiber::Destroy() noexcept
    {
        detail::DestroyFiberControl(std::exchange(m_control, nullptr));
    }

    SwitchOutcome Fiber::Resume()
    {
        if (!m_control)
        {
            ThrowEmptyFiber("Resume");
        }
        return detail::ResumeFiber(m_control);
    }

    void Fiber::Rearm(FiberEntry entry, void* argument)
    {
        if (!m_control)
        {
            ThrowEmptyFiber("Rearm");
        }
        detail::RearmFiber(m_control, entry, argument);
    }

    FiberState Fiber::State() const noexcept
    {
        return m_control ? detail::GetFiberState(m_control) : FiberState::Terminated;
    }

    UIntSize Fiber::StackSize() const noexcept
    {
        return m_control ? detail::FiberStackSize(m_control) : 0;
    }

    void Fiber::DiscardUnusedStack()
    {
        if (m_control)
        {
            detail::DiscardFiberStack(m_control);
        }
    }

    void Fiber::SetOwner(const FiberPool* owner) noexcept
    {
        if (m_control)
        {
            detail::SetFiberOwner(m_control, owner);
        }
    }

    const FiberPool* Fiber::Owner() const noexcept
    {
        return m_control ? detail::FiberOwner(m_control) : nullptr;
    }

    bool Fiber::HasException() const noexcept
    {
        return m_control && detail::FiberHasException(m_control);
    }

    std::exception_ptr Fiber::TakeException() noexcept
    {
        if (!m_control)
        {
            return {};
        }
        return detail::FiberTakeException(m_control);
    }

    bool Fiber::IsInFiber() noexcept
    {
        return detail::IsInFiber();
    }

    void Fiber::YieldNow()
    {
        detail::YieldFiber();
    }

    void Fiber::YieldTo(Fiber& target)
    {
        if (!target.m_control)
        {
            ThrowEmptyFiber("YieldTo");
        }
        detail::YieldToFiber(target.m_control);
    }

    void Fiber::ExitTo(Fiber&& self, Fiber& target)
    {
        Exit(self, target, nullptr);
    }

    void Fiber::ExitToPool(Fiber&& self, Fiber& target, FiberPool& pool)
    {
        Exit(self, target, &pool);
    }

    void Fiber::Exit(Fiber& self, Fiber& target, FiberPool* pool)
    {
        if (!self.m_control)
        {
            ThrowEmptyFiber("ExitTo");
        }
        if (!target.m_control)
        {
            ThrowEmptyFiber("ExitTo");
        }
        detail::CheckExit(self.m_control, target.m_control);
        detail::ExitFiber(std::exchange(self.m_control, nullptr), target.m_control, &Fiber::DisposeExited, pool);
    }

    void Fiber::DisposeExited(detail::FiberControl* control, void* pool) noexcept
    {
        Fiber exited(control);
        if (pool)
        {
            // An exception from Release terminates the process.
            static_cast<FiberPool*>(pool)->Release(std::move(exited));
        }
    }
}// namespace Spindle::Execution
