#include <Spindle/Execution/Fiber.hpp>
#include <Spindle/Execution/FiberExecutor.hpp>
#include <Spindle/Execution/FiberPool.hpp>
#include <Spindle/Execution/ThisFiber.hpp>
#include <Spindle/Log/Log.hpp>

#include <fmt/core.h>

#include <chrono>
#include <cstdlib>
#include <exception>

using namespace Spindle::Execution;

namespace
{
    constexpr int ROUNDS = 1'000'000;

    struct PingPong
    {
        Fiber* ping {nullptr};
        Fiber* pong {nullptr};
        int    exchanges {0};
    };

    void Ping(void* raw)
    {
        auto& state = *static_cast<PingPong*>(raw);
        for (int i = 0; i < ROUNDS; ++i)
        {
            ++state.exchanges;
            ThisFiber::YieldTo(*state.pong);
        }
    }

    void Pong(void* raw)
    {
        auto& state = *static_cast<PingPong*>(raw);
        for (int i = 0; i < ROUNDS; ++i)
        {
            ++state.exchanges;
            ThisFiber::YieldTo(*state.ping);
        }
    }

    struct Worker
    {
        int id {0};
        int steps {0};
    };

    void Work(void* raw)
    {
        auto& worker = *static_cast<Worker*>(raw);
        for (int i = 0; i < 3; ++i)
        {
            ++worker.steps;
            ThisFiber::YieldNow();
        }
        Spindle::Log::Info("example", "worker {} finished after {} steps", worker.id, worker.steps);
    }

    void RunPingPong()
    {
        PingPong state;
        Fiber    ping(&Ping, &state);
        Fiber    pong(&Pong, &state);
        state.ping = &ping;
        state.pong = &pong;

        const auto start   = std::chrono::steady_clock::now();
        const auto outcome = ping.Resume();
        const auto elapsed = std::chrono::duration<double, std::nano>(std::chrono::steady_clock::now() - start);

        fmt::print("ping-pong: {} exchanges, outcome {}, {:.1f} ns per switch\n", state.exchanges,
                   outcome == SwitchOutcome::Terminated ? "terminated" : "unexpected", elapsed.count() / state.exchanges);
        (void) pong.Resume();
    }

    void RunPooledWorkers()
    {
        FiberPoolOptions options;
        options.stack.stackSize = 64 * 1024;
        options.capacity        = 8;
        options.policy          = FiberPoolPolicy::Proportional;

        FiberPool     pool(options);
        FiberExecutor executor(&pool);

        Worker workers[16];
        for (int batch = 0; batch < 4; ++batch)
        {
            for (int i = 0; i < 16; ++i)
            {
                workers[i] = Worker {.id = batch * 16 + i};
                executor.Spawn(&Work, &workers[i]);
            }
            executor.RunUntilIdle();
        }

        const auto stats = pool.Stats();
        fmt::print("pool: created {}, reused {}, dropped {}, cached {}\n", stats.created, stats.reused, stats.dropped,
                   stats.cached);
    }
}// namespace

int main()
{
    try
    {
        RunPingPong();
        RunPooledWorkers();
    } catch (const std::exception& ex)
    {
        fmt::print(stderr, "error: {}\n", ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
