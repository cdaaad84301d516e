/// @file FiberPool.hpp
/// @brief Cache of idle fiber stacks, reused through intercept instead of a fresh bootstrap.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Execution/Fiber.hpp>
#include <Spindle/Primitives.hpp>

#include <mutex>
#include <vector>

namespace Spindle::Execution
{
    enum class FiberPoolPolicy : UInt8
    {
        Fixed,       ///< Cache up to `capacity` stacks.
        Proportional,///< Cache up to min(capacity, 20% of the fibers currently handed out + 16).
    };

    struct FiberPoolOptions final
    {
        FiberStackOptions stack {};
        UIntSize          capacity {64};
        FiberPoolPolicy   policy {FiberPoolPolicy::Fixed};
        bool              discardOnRelease {true};// return unused pages of mmap-backed stacks before caching
    };

    struct FiberPoolStats final
    {
        UInt64 active {0}; ///< Fibers handed out by Acquire and not released yet.
        UInt64 cached {0};
        UInt64 created {0};///< Acquires served by allocating a new stack.
        UInt64 reused {0}; ///< Acquires served from the cache.
        UInt64 dropped {0};///< Released stacks that were destroyed instead of cached.
    };

    /// @brief Hands out fibers and takes back terminated ones, all sharing one stack size.
    ///
    /// @details
    /// Acquire prefers the most recently released stack and re-targets its parked context with an intercept; only
    /// when the cache is empty does it allocate and bootstrap a new stack. Release caches the stack while the cache is
    /// below its limit and destroys it otherwise, so the cache never exceeds the limit.
    ///
    /// The cache is guarded by a mutex so a pool may be shared between threads; one pool per thread avoids the
    /// contention entirely.
    class SPINDLE_BASE_API FiberPool
    {
    public:
        FiberPool();
        explicit FiberPool(FiberPoolOptions options);
        ~FiberPool();

        FiberPool(const FiberPool&)            = delete;
        FiberPool& operator=(const FiberPool&) = delete;

        /// @brief A fiber ready to Resume into `entry(argument)`. Throws AllocationError.
        [[nodiscard]] Fiber Acquire(FiberEntry entry, void* argument);

        /// @brief Takes back a terminated (or never started) fiber. Throws InvalidFiberError for fibers that are
        /// running or suspended, whose stacks are still in use.
        ///
        /// Any fiber of the pool's stack size may be cached, but only fibers this pool handed out leave the `active`
        /// count.
        void Release(Fiber&& fiber);

        /// @brief Destroys every cached stack.
        void Trim() noexcept;

        [[nodiscard]] FiberPoolStats Stats() const;
        [[nodiscard]] UIntSize       Limit() const;
        [[nodiscard]] UIntSize       StackSize() const noexcept { return m_stackSize; }

    private:
        [[nodiscard]] UIntSize LimitLocked() const noexcept;

        FiberPoolOptions   m_options;
        UIntSize           m_stackSize {0};
        mutable std::mutex m_mutex;
        std::vector<Fiber> m_cached;
        UInt64             m_active {0};
        UInt64             m_created {0};
        UInt64             m_reused {0};
        UInt64             m_dropped {0};
    };
}// namespace Spindle::Execution
