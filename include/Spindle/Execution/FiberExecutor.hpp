/// @file FiberExecutor.hpp
/// @brief Single-thread, cooperative fiber runner with RunUntilIdle pumping.
#pragma once

#include <Spindle/Defines.hpp>
#include <Spindle/Execution/Fiber.hpp>
#include <Spindle/Primitives.hpp>

#include <deque>
#include <exception>
#include <vector>

namespace Spindle::Execution
{
    class FiberPool;

    /// @brief Runs spawned fibers round-robin on the calling thread.
    ///
    /// This executor never spawns background threads. Fibers run only when the caller pumps it via
    /// `RunOne`/`RunUntilIdle`. A fiber that yields goes to the back of the ready queue; one that terminates is handed
    /// back to the attached pool, or destroyed when there is none.
    class SPINDLE_BASE_API FiberExecutor final
    {
    public:
        explicit FiberExecutor(FiberPool* pool = nullptr, FiberStackOptions stackOptions = {});
        ~FiberExecutor();

        FiberExecutor(const FiberExecutor&)            = delete;
        FiberExecutor& operator=(const FiberExecutor&) = delete;

        /// @brief Queues `entry(argument)` behind every fiber already pending. Throws AllocationError.
        void Spawn(FiberEntry entry, void* argument);

        /// @brief Resumes the oldest ready fiber once. Returns false when nothing was pending.
        [[nodiscard]] bool RunOne();

        void RunUntilIdle();

        [[nodiscard]] UIntSize Pending() const noexcept { return m_ready.size(); }

        /// @brief Exceptions that escaped spawned entries since the last call, oldest first.
        [[nodiscard]] std::vector<std::exception_ptr> TakeFaults() noexcept;

    private:
        void Retire(Fiber&& fiber);

        FiberPool*                      m_pool {nullptr};
        FiberStackOptions               m_stackOptions {};
        std::deque<Fiber>               m_ready {};
        std::vector<std::exception_ptr> m_faults {};
    };
}// namespace Spindle::Execution
