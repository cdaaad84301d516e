#include <Spindle/Execution/FiberExecutor.hpp>
#include <Spindle/Execution/FiberPool.hpp>
#include <Spindle/Log/Log.hpp>

#include <exception>
#include <string>
#include <utility>

namespace Spindle::Execution
{
    namespace
    {
        std::string DescribeFault(const std::exception_ptr& fault)
        {
            try
            {
                std::rethrow_exception(fault);
            } catch (const std::exception& ex)
            {
                return ex.what();
            } catch (...)
            {
                return "non-standard exception";
            }
        }
    }// namespace

    FiberExecutor::FiberExecutor(FiberPool* pool, FiberStackOptions stackOptions)
        : m_pool(pool)
        , m_stackOptions(std::move(stackOptions))
    {
    }

    FiberExecutor::~FiberExecutor()
    {
        if (!m_ready.empty())
        {
            Log::Warning("executor", "destroying {} pending fibers without running them to completion", m_ready.size());
        }
    }

    void FiberExecutor::Spawn(FiberEntry entry, void* argument)
    {
        if (m_pool)
        {
            m_ready.push_back(m_pool->Acquire(entry, argument));
        }
        else
        {
            m_ready.emplace_back(entry, argument, m_stackOptions);
        }
    }

    bool FiberExecutor::RunOne()
    {
        if (m_ready.empty())
        {
            return false;
        }

        Fiber fiber = std::move(m_ready.front());
        m_ready.pop_front();

        switch (fiber.Resume())
        {
            case SwitchOutcome::Yielded:
                m_ready.push_back(std::move(fiber));
                break;
            case SwitchOutcome::Faulted: {
                std::exception_ptr fault = fiber.TakeException();
                Log::Warning("executor", "fiber terminated by an exception: {}", DescribeFault(fault));
                m_faults.push_back(std::move(fault));
                Retire(std::move(fiber));
                break;
            }
            case SwitchOutcome::Terminated:
                Retire(std::move(fiber));
                break;
        }
        return true;
    }

    void FiberExecutor::RunUntilIdle()
    {
        while (RunOne()) {}
    }

    std::vector<std::exception_ptr> FiberExecutor::TakeFaults() noexcept
    {
        return std::exchange(m_faults, {});
    }

    void FiberExecutor::Retire(Fiber&& fiber)
    {
        if (m_pool)
        {
            m_pool->Release(std::move(fiber));
        }
    }
}// namespace Spindle::Execution
