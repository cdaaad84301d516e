/// @file Fiber.cpp
/// @brief Tests for Spindle::Execution::Fiber.

#include <Spindle/Execution/Fiber.hpp>
#include <Spindle/Execution/ThisFiber.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace Spindle::Execution;

namespace
{
    const FiberStackOptions SMALL_STACK {.stackSize = 64 * 1024};

    struct Counter
    {
        int value {0};
        int rounds {0};
    };

    void CountWithYields(void* raw)
    {
        auto& counter = *static_cast<Counter*>(raw);
        for (int i = 0; i < counter.rounds; ++i)
        {
            ++counter.value;
            Fiber::YieldNow();
        }
        ++counter.value;
    }

    void Increment(void* raw)
    {
        ++*static_cast<int*>(raw);
    }

    void Throw(void*)
    {
        throw std::runtime_error("boom");
    }
}// namespace

TEST_CASE("Fiber does not run on construction", "[Execution][Fiber]")
{
    int   counter = 0;
    Fiber fiber(&Increment, &counter, SMALL_STACK);

    CHECK(counter == 0);
    CHECK(fiber.State() == FiberState::Created);
    CHECK(fiber.StackSize() == 64 * 1024);

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(counter == 1);
    CHECK(fiber.State() == FiberState::Terminated);
}

TEST_CASE("Fiber yields and resumes", "[Execution][Fiber]")
{
    Counter counter {.rounds = 2};
    Fiber   fiber(&CountWithYields, &counter, SMALL_STACK);

    CHECK(fiber.Resume() == SwitchOutcome::Yielded);
    CHECK(counter.value == 1);
    CHECK(fiber.State() == FiberState::Suspended);

    CHECK(fiber.Resume() == SwitchOutcome::Yielded);
    CHECK(counter.value == 2);

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(counter.value == 3);
}

TEST_CASE("Fiber computes a sum through its argument slot", "[Execution][Fiber]")
{
    struct Sum
    {
        int a {0};
        int b {0};
        int result {0};
    } slot {.a = 2, .b = 3};

    Fiber fiber(+[](void* raw) {
        auto& sum  = *static_cast<Sum*>(raw);
        sum.result = sum.a + sum.b;
    },
                &slot, SMALL_STACK);

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(slot.result == 5);
}

TEST_CASE("Fiber reports N yields before termination", "[Execution][Fiber]")
{
    Counter counter {.rounds = 100};
    Fiber   fiber(&CountWithYields, &counter, SMALL_STACK);

    int yields = 0;
    while (fiber.Resume() == SwitchOutcome::Yielded)
    {
        ++yields;
        CHECK(counter.value == yields);
    }
    CHECK(yields == 100);
    CHECK(counter.value == 101);
}

TEST_CASE("Two fibers interleave when resumed alternately", "[Execution][Fiber]")
{
    struct Shared
    {
        std::string log;
    } shared;

    struct Job
    {
        Shared* shared;
        char    tag;
        int     yields;
    };

    auto entry = +[](void* raw) {
        auto& job = *static_cast<Job*>(raw);
        for (int i = 0; i < job.yields; ++i)
        {
            job.shared->log.push_back(job.tag);
            ThisFiber::YieldNow();
        }
        job.shared->log.push_back(static_cast<char>(job.tag - 'a' + 'A'));
    };

    Job   jobA {&shared, 'a', 2};
    Job   jobB {&shared, 'b', 3};
    Fiber a(entry, &jobA, SMALL_STACK);
    Fiber b(entry, &jobB, SMALL_STACK);

    int aYields = 0;
    int bYields = 0;
    while (a || b)
    {
        if (a)
        {
            if (a.Resume() == SwitchOutcome::Yielded)
                ++aYields;
            else
                a = Fiber {};
        }
        if (b)
        {
            if (b.Resume() == SwitchOutcome::Yielded)
                ++bYields;
            else
                b = Fiber {};
        }
    }

    CHECK(aYields == 2);
    CHECK(bYields == 3);
    CHECK(shared.log == "ababAbB");
}

TEST_CASE("Fiber ping-pong through YieldTo", "[Execution][Fiber]")
{
    struct PingPong
    {
        Fiber*           ping {nullptr};
        Fiber*           pong {nullptr};
        int              counter {0};
        int              rounds {1000};
        std::vector<int> order;
    } state;

    auto pingEntry = +[](void* raw) {
        auto& s = *static_cast<PingPong*>(raw);
        for (int i = 0; i < s.rounds; ++i)
        {
            ++s.counter;
            s.order.push_back(0);
            Fiber::YieldTo(*s.pong);
        }
    };
    auto pongEntry = +[](void* raw) {
        auto& s = *static_cast<PingPong*>(raw);
        for (int i = 0; i < s.rounds; ++i)
        {
            ++s.counter;
            s.order.push_back(1);
            Fiber::YieldTo(*s.ping);
        }
    };

    Fiber ping(pingEntry, &state, SMALL_STACK);
    Fiber pong(pongEntry, &state, SMALL_STACK);
    state.ping = &ping;
    state.pong = &pong;

    // ping runs its loop to completion after pong's last YieldTo, and termination returns here.
    CHECK(ping.Resume() == SwitchOutcome::Terminated);
    CHECK(state.counter == 2000);
    CHECK(ping.State() == FiberState::Terminated);
    CHECK(pong.State() == FiberState::Suspended);

    bool alternating = state.order.size() == 2000;
    for (std::size_t i = 0; alternating && i < state.order.size(); ++i)
    {
        alternating = state.order[i] == static_cast<int>(i % 2);
    }
    CHECK(alternating);

    // pong resumes after its final YieldTo and finishes its loop.
    CHECK(pong.Resume() == SwitchOutcome::Terminated);
    CHECK(state.counter == 2000);
}

TEST_CASE("Fiber nested resume returns to the resuming fiber", "[Execution][Fiber]")
{
    struct Nested
    {
        Fiber*           inner {nullptr};
        std::vector<int> trace;
    } state;

    auto innerEntry = +[](void* raw) {
        auto& s = *static_cast<Nested*>(raw);
        s.trace.push_back(2);
        Fiber::YieldNow();
        s.trace.push_back(5);
    };
    auto outerEntry = +[](void* raw) {
        auto& s = *static_cast<Nested*>(raw);
        s.trace.push_back(1);
        CHECK(s.inner->Resume() == SwitchOutcome::Yielded);
        s.trace.push_back(3);
        Fiber::YieldNow();
        s.trace.push_back(4);
        CHECK(s.inner->Resume() == SwitchOutcome::Terminated);
        s.trace.push_back(6);
    };

    Fiber inner(innerEntry, &state, SMALL_STACK);
    Fiber outer(outerEntry, &state, SMALL_STACK);
    state.inner = &inner;

    CHECK(outer.Resume() == SwitchOutcome::Yielded);
    CHECK(state.trace == std::vector<int> {1, 2, 3});
    CHECK(inner.State() == FiberState::Suspended);

    CHECK(outer.Resume() == SwitchOutcome::Terminated);
    CHECK(state.trace == std::vector<int> {1, 2, 3, 4, 5, 6});
}

TEST_CASE("Fiber IsInFiber tracks the running context", "[Execution][Fiber]")
{
    CHECK_FALSE(ThisFiber::IsInFiber());

    bool inside = false;
    Fiber fiber(+[](void* raw) { *static_cast<bool*>(raw) = ThisFiber::IsInFiber(); }, &inside, SMALL_STACK);
    CHECK(fiber.Resume() == SwitchOutcome::Terminated);

    CHECK(inside);
    CHECK_FALSE(ThisFiber::IsInFiber());
}

TEST_CASE("Fiber captures exceptions escaping the entry", "[Execution][Fiber]")
{
    Fiber fiber(&Throw, nullptr, SMALL_STACK);

    CHECK(fiber.Resume() == SwitchOutcome::Faulted);
    CHECK(fiber.State() == FiberState::Terminated);
    REQUIRE(fiber.HasException());

    auto error = fiber.TakeException();
    CHECK_FALSE(fiber.HasException());
    CHECK_THROWS_AS(std::rethrow_exception(error), std::runtime_error);
}

TEST_CASE("Fiber rejects resuming itself", "[Execution][Fiber]")
{
    struct Self
    {
        Fiber* fiber {nullptr};
        bool   rejected {false};
    } state;

    Fiber fiber(+[](void* raw) {
        auto& s = *static_cast<Self*>(raw);
        try
        {
            (void) s.fiber->Resume();
        } catch (const ReentrancyError&)
        {
            s.rejected = true;
        }
    },
                &state, SMALL_STACK);
    state.fiber = &fiber;

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(state.rejected);
}

TEST_CASE("Fiber rejects resuming a fiber blocked in a nested resume", "[Execution][Fiber]")
{
    struct Blocked
    {
        Fiber* outer {nullptr};
        Fiber* inner {nullptr};
        bool   rejected {false};
    } state;

    Fiber inner(+[](void* raw) {
        auto& s = *static_cast<Blocked*>(raw);
        try
        {
            (void) s.outer->Resume();
        } catch (const ReentrancyError&)
        {
            s.rejected = true;
        }
    },
                &state, SMALL_STACK);
    Fiber outer(+[](void* raw) {
        auto& s = *static_cast<Blocked*>(raw);
        (void) s.inner->Resume();
    },
                &state, SMALL_STACK);
    state.outer = &outer;
    state.inner = &inner;

    CHECK(outer.Resume() == SwitchOutcome::Terminated);
    CHECK(state.rejected);
    CHECK(inner.State() == FiberState::Terminated);
}

TEST_CASE("Fiber rejects YieldTo itself", "[Execution][Fiber]")
{
    struct Self
    {
        Fiber* fiber {nullptr};
        bool   rejected {false};
    } state;

    Fiber fiber(+[](void* raw) {
        auto& s = *static_cast<Self*>(raw);
        try
        {
            Fiber::YieldTo(*s.fiber);
        } catch (const ReentrancyError&)
        {
            s.rejected = true;
        }
    },
                &state, SMALL_STACK);
    state.fiber = &fiber;

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(state.rejected);
}

TEST_CASE("Fiber ExitTo ends the running fiber and continues in the target", "[Execution][Fiber]")
{
    struct Exit
    {
        Fiber            self;
        Fiber*           target {nullptr};
        std::vector<int> trace;
    } state;

    state.self = Fiber(+[](void* raw) {
        auto& s = *static_cast<Exit*>(raw);
        s.trace.push_back(1);
        Fiber::ExitTo(std::move(s.self), *s.target);
    },
                       &state, SMALL_STACK);
    Fiber target(+[](void* raw) {
        auto& s = *static_cast<Exit*>(raw);
        s.trace.push_back(s.self.IsValid() ? -1 : 2);
        Fiber::YieldNow();
        s.trace.push_back(3);
    },
                 &state, SMALL_STACK);
    state.target = &target;

    // The fiber we resumed is gone; the target's yield comes back to this Resume.
    CHECK(state.self.Resume() == SwitchOutcome::Terminated);
    CHECK_FALSE(state.self.IsValid());
    CHECK(state.trace == std::vector<int> {1, 2});
    CHECK(target.State() == FiberState::Suspended);

    CHECK(target.Resume() == SwitchOutcome::Terminated);
    CHECK(state.trace == std::vector<int> {1, 2, 3});
}

TEST_CASE("Fiber ExitTo requires the handle of the running fiber", "[Execution][Fiber]")
{
    int   counter = 0;
    Fiber first(&Increment, &counter, SMALL_STACK);
    Fiber second(&Increment, &counter, SMALL_STACK);

    CHECK_THROWS_AS(Fiber::ExitTo(std::move(first), second), InvalidFiberError);
    CHECK(first.IsValid());

    struct Misuse
    {
        Fiber* other {nullptr};
        Fiber* target {nullptr};
        bool   rejected {false};
    } state {&first, &second};

    Fiber runner(+[](void* raw) {
        auto& s = *static_cast<Misuse*>(raw);
        try
        {
            Fiber::ExitTo(std::move(*s.other), *s.target);
        } catch (const InvalidFiberError&)
        {
            s.rejected = true;
        }
    },
                 &state, SMALL_STACK);

    CHECK(runner.Resume() == SwitchOutcome::Terminated);
    CHECK(state.rejected);
    CHECK(first.IsValid());
    CHECK(second.State() == FiberState::Created);
    CHECK(counter == 0);
}

TEST_CASE("Fiber destroyed by the fiber it yielded to", "[Execution][Fiber]")
{
    struct Handover
    {
        Fiber* a {nullptr};
        Fiber* b {nullptr};
        int    steps {0};
    } state;

    Fiber a(+[](void* raw) {
        auto& s = *static_cast<Handover*>(raw);
        ++s.steps;
        Fiber::YieldTo(*s.b);
    },
            &state, SMALL_STACK);
    Fiber b(+[](void* raw) {
        auto& s = *static_cast<Handover*>(raw);
        ++s.steps;
        // a is suspended inside YieldTo; its resumer now belongs to b.
        *s.a = Fiber {};
        Fiber::YieldNow();
        ++s.steps;
    },
            &state, SMALL_STACK);
    state.a = &a;
    state.b = &b;

    CHECK(a.Resume() == SwitchOutcome::Terminated);
    CHECK_FALSE(a.IsValid());
    CHECK(b.State() == FiberState::Suspended);

    CHECK(b.Resume() == SwitchOutcome::Terminated);
    CHECK(state.steps == 3);
}

TEST_CASE("Fiber operations on terminated or empty fibers throw", "[Execution][Fiber]")
{
    int   counter = 0;
    Fiber fiber(&Increment, &counter, SMALL_STACK);
    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK_THROWS_AS(fiber.Resume(), InvalidFiberError);

    Fiber empty;
    CHECK_FALSE(empty.IsValid());
    CHECK(empty.State() == FiberState::Terminated);
    CHECK_THROWS_AS(empty.Resume(), InvalidFiberError);
    CHECK_THROWS_AS(empty.Rearm(&Increment, &counter), InvalidFiberError);

    CHECK_THROWS_AS(Fiber::YieldNow(), InvalidFiberError);
    CHECK_THROWS_AS(Fiber(nullptr, nullptr, SMALL_STACK), InvalidFiberError);
}

TEST_CASE("Fiber Rearm reuses a terminated stack", "[Execution][Fiber]")
{
    int     counter = 0;
    Counter yielding {.rounds = 1};
    Fiber   fiber(&Increment, &counter, SMALL_STACK);

    for (int round = 1; round <= 5; ++round)
    {
        CHECK(fiber.Resume() == SwitchOutcome::Terminated);
        CHECK(counter == round);
        fiber.Rearm(&Increment, &counter);
        CHECK(fiber.State() == FiberState::Created);
    }

    fiber.Rearm(&CountWithYields, &yielding);
    CHECK(fiber.Resume() == SwitchOutcome::Yielded);
    CHECK_THROWS_AS(fiber.Rearm(&Increment, &counter), InvalidFiberError);
    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(yielding.value == 2);
}

TEST_CASE("Fiber Rearm after a fault clears the exception", "[Execution][Fiber]")
{
    int   counter = 0;
    Fiber fiber(&Throw, nullptr, SMALL_STACK);
    CHECK(fiber.Resume() == SwitchOutcome::Faulted);

    fiber.Rearm(&Increment, &counter);
    CHECK_FALSE(fiber.HasException());
    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(counter == 1);
}

TEST_CASE("Fiber Create runs on a caller-provided stack", "[Execution][Fiber]")
{
    int  counter = 0;
    auto stack   = FiberStack::Allocate(FiberStackOptions {.stackSize = 32 * 1024, .guardPages = true});
    auto fiber   = Fiber::Create(std::move(stack), &Increment, &counter);

    CHECK(fiber.Resume() == SwitchOutcome::Terminated);
    CHECK(counter == 1);
    CHECK_THROWS_AS(Fiber::Create(FiberStack {}, &Increment, &counter), InvalidFiberError);
}

TEST_CASE("Fibers run independently on separate threads", "[Execution][Fiber]")
{
    constexpr int         THREADS = 4;
    std::atomic<int>      total {0};
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t)
    {
        threads.emplace_back([&total] {
            Counter counter {.rounds = 50};
            Fiber   fiber(&CountWithYields, &counter, SMALL_STACK);
            while (fiber.Resume() == SwitchOutcome::Yielded)
            {
                std::this_thread::yield();
            }
            total += counter.value;
        });
    }
    for (auto& thread: threads)
    {
        thread.join();
    }
    CHECK(total.load() == THREADS * 51);
}
