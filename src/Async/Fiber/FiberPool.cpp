#include <Spindle/Execution/FiberPool.hpp>
#include <Spindle/Log/Log.hpp>

#include <algorithm>
#include <utility>

namespace Spindle::Execution
{
    namespace
    {
        constexpr UInt64 PROPORTIONAL_PERCENT = 20;
        constexpr UInt64 PROPORTIONAL_FLOOR   = 16;
    }// namespace

    FiberPool::FiberPool()
        : FiberPool(FiberPoolOptions {})
    {
    }

    FiberPool::FiberPool(FiberPoolOptions options)
        : m_options(std::move(options))
        , m_stackSize(FiberStack::UsableSize(m_options.stack))
    {
        // Cached fibers never exceed capacity, so Release never reallocates under the lock.
        m_cached.reserve(m_options.capacity);
    }

    FiberPool::~FiberPool()
    {
        Trim();
    }

    Fiber FiberPool::Acquire(FiberEntry entry, void* argument)
    {
        if (entry == nullptr)
        {
            throw InvalidFiberError("FiberPool::Acquire requires an entry function");
        }

        Fiber fiber;
        {
            std::lock_guard lock(m_mutex);
            ++m_active;
            if (!m_cached.empty())
            {
                fiber = std::move(m_cached.back());
                m_cached.pop_back();
                ++m_reused;
            }
            else
            {
                ++m_created;
            }
        }

        if (fiber)
        {
            Log::Trace("pool", "reusing stack of {} bytes", m_stackSize);
            fiber.Rearm(entry, argument);
            fiber.SetOwner(this);
            return fiber;
        }

        Log::Trace("pool", "creating stack of {} bytes", m_stackSize);
        try
        {
            Fiber created(entry, argument, m_options.stack);
            created.SetOwner(this);
            return created;
        } catch (const AllocationError&)
        {
            std::lock_guard lock(m_mutex);
            --m_active;
            --m_created;
            throw;
        }
    }

    void FiberPool::Release(Fiber&& fiber)
    {
        if (!fiber)
        {
            throw InvalidFiberError("FiberPool::Release: the fiber is empty");
        }

        const FiberState state = fiber.State();
        if (state != FiberState::Terminated && state != FiberState::Created)
        {
            throw InvalidFiberError("FiberPool::Release requires a terminated or unstarted fiber");
        }

        Fiber released = std::move(fiber);
        (void) released.TakeException();
        const bool handedOut = released.Owner() == this;
        released.SetOwner(nullptr);

        const bool sameSizeClass = released.StackSize() == m_stackSize;
        if (sameSizeClass && m_options.discardOnRelease)
        {
            released.DiscardUnusedStack();
        }

        {
            std::lock_guard lock(m_mutex);
            if (handedOut)
            {
                --m_active;
            }

            if (sameSizeClass && m_cached.size() < LimitLocked())
            {
                m_cached.push_back(std::move(released));
            }
            else
            {
                ++m_dropped;
            }
        }

        if (!released)
        {
            Log::Trace("pool", "preserving stack");
        }
        else if (sameSizeClass)
        {
            Log::Trace("pool", "dropping stack, cache is full");
        }
        else
        {
            Log::Trace("pool", "dropping stack of {} bytes, pool serves {}", released.StackSize(), m_stackSize);
        }
        // A dropped fiber is destroyed here, outside the lock.
    }

    void FiberPool::Trim() noexcept
    {
        std::vector<Fiber> cached;
        {
            std::lock_guard lock(m_mutex);
            cached.swap(m_cached);
            m_cached.reserve(cached.capacity());
        }
    }

    FiberPoolStats FiberPool::Stats() const
    {
        std::lock_guard lock(m_mutex);
        return FiberPoolStats {
                .active  = m_active,
                .cached  = m_cached.size(),
                .created = m_created,
                .reused  = m_reused,
                .dropped = m_dropped,
        };
    }

    UIntSize FiberPool::Limit() const
    {
        std::lock_guard lock(m_mutex);
        return LimitLocked();
    }

    UIntSize FiberPool::LimitLocked() const noexcept
    {
        if (m_options.policy == FiberPoolPolicy::Proportional)
        {
            const UInt64 ideal = m_active * PROPORTIONAL_PERCENT / 100 + PROPORTIONAL_FLOOR;
            return static_cast<UIntSize>(std::min<UInt64>(ideal, m_options.capacity));
        }
        return m_options.capacity;
    }
}// namespace Spindle::Execution
