#include <taskstep/builder.hpp>
#include <taskstep/future.hpp>

#include <cassert>
#include <deque>
#include <memory>

#include <celero/Celero.h>


using namespace taskstep;


constexpr int numSamples = 1000;
constexpr int numIterations = 5000;


BASELINE(run, immediate, numSamples, numIterations) {
    auto fut = task([](task_builder b) { return b.ret(1); });
    const bool ready = fut.ready();
    assert(ready);
    celero::DoNotOptimizeAway(ready);
}


BENCHMARK(run, completed_await, numSamples, numIterations) {
    auto fut = task([](task_builder b) {
        return b.bind(make_ready_future(1), [b](int x) { return b.ret(x + 1); });
    });
    const bool ready = fut.ready();
    assert(ready);
    celero::DoNotOptimizeAway(ready);
}


BENCHMARK(run, suspended_await, numSamples, numIterations) {
    promise<int> pr;
    auto fut = task([next = pr.get_future()](task_builder b) {
        return b.bind(next, [b](int x) { return b.ret(x + 1); });
    });
    pr.set_value(1);
    const bool ready = fut.ready();
    assert(ready);
    celero::DoNotOptimizeAway(ready);
}


BASELINE(while_loop, synchronous, 100, 100) {
    static constexpr int iterations = 100;
    auto counter = std::make_shared<int>(0);
    auto fut = task([counter](task_builder b) {
        return b.while_loop([counter] { return *counter < iterations; },
                            [counter, b] {
                                ++*counter;
                                return b.zero();
                            });
    });
    const bool ready = fut.ready();
    assert(ready);
    celero::DoNotOptimizeAway(ready);
}


BENCHMARK(while_loop, suspending, 100, 100) {
    static constexpr int iterations = 100;
    auto counter = std::make_shared<int>(0);
    std::deque<promise<unit>> pending;
    auto fut = task([counter, &pending](task_builder b) {
        return b.while_loop([counter] { return *counter < iterations; },
                            [counter, &pending, b] {
                                ++*counter;
                                pending.emplace_back();
                                return b.bind(pending.back().get_future(), [b](unit) { return b.zero(); });
                            });
    });
    while (!pending.empty()) {
        auto pr = std::move(pending.front());
        pending.pop_front();
        pr.set_value(unit{});
    }
    const bool ready = fut.ready();
    assert(ready);
    celero::DoNotOptimizeAway(ready);
}
