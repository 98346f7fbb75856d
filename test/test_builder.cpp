#include "helper_awaitables.hpp"
#include "helper_schedulers.hpp"

#include <taskstep/builder.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>


using namespace taskstep;


TEST_CASE("Builder: return", "[Builder]") {
    auto fut = task([](task_builder b) { return b.ret(std::string("value")); });
    REQUIRE(fut.ready());
    REQUIRE(fut.get_awaiter().get_result() == "value");
}


TEST_CASE("Builder: bind", "[Builder]") {
    manual_event<int> evt;
    auto fut = task([&evt](task_builder b) {
        return b.bind(evt, [b](int x) { return b.ret(x + 1); });
    });
    REQUIRE(!fut.ready());
    evt.set_value(1);
    REQUIRE(fut.get_awaiter().get_result() == 2);
}


TEST_CASE("Builder: return from", "[Builder]") {
    SECTION("future") {
        auto source = make_ready_future(1);
        auto fut = task([source](task_builder b) { return b.return_from(source); });
        REQUIRE(fut == source);
    }
    SECTION("awaitable") {
        manual_event<int> evt;
        auto fut = task([&evt](task_builder b) { return b.return_from(evt); });
        evt.set_value(3);
        REQUIRE(fut.get_awaiter().get_result() == 3);
    }
}


TEST_CASE("Builder: delay", "[Builder]") {
    int calls = 0;
    auto fut = task([&calls](task_builder b) {
        const auto delayed = b.delay([&calls, b] {
            ++calls;
            return b.zero();
        });
        return b.combine(delayed(), delayed);
    });
    REQUIRE(fut.ready());
    REQUIRE(calls == 2);
}


TEST_CASE("Builder: control flow", "[Builder]") {
    manual_event<void> gate;
    std::vector<int> seen;
    int compensations = 0;

    // for x in [1, 2, 3]:
    //     try:
    //         if x == 2: await gate
    //         if x == 3: throw
    //         seen += x
    //     except: seen += -x
    //     finally: compensations += 1
    auto fut = task([&](task_builder b) {
        return b.for_loop(std::vector<int>{ 1, 2, 3 }, [&, b](int x) {
            return b.try_finally(
                [&, b, x] {
                    return b.try_with(
                        [&, b, x] {
                            const auto rest = [&, b, x]() -> step<unit> {
                                if (x == 3) {
                                    throw std::runtime_error("three");
                                }
                                seen.push_back(x);
                                return b.zero();
                            };
                            if (x == 2) {
                                return b.bind(gate, rest);
                            }
                            return rest();
                        },
                        [&, b, x](std::exception_ptr) {
                            seen.push_back(-x);
                            return b.zero();
                        });
                },
                [&compensations] { ++compensations; });
        });
    });
    REQUIRE(!fut.ready());
    REQUIRE(seen == std::vector{ 1 });
    REQUIRE(compensations == 1);
    gate.set_value();
    REQUIRE(fut.ready());
    REQUIRE(seen == std::vector{ 1, 2, -3 });
    REQUIRE(compensations == 3);
}


TEST_CASE("Builder: while loop", "[Builder]") {
    auto counter = std::make_shared<int>(0);
    auto fut = task([counter](task_builder b) {
        return b.combine(
            b.while_loop([counter] { return *counter < 10; },
                         [counter, b] {
                             ++*counter;
                             return b.zero();
                         }),
            [counter, b] { return b.ret(*counter); });
    });
    REQUIRE(fut.get_awaiter().get_result() == 10);
}


TEST_CASE("Builder: use", "[Builder]") {
    tracked_resource resource;
    const auto releases = resource.releases;
    manual_event<int> evt;
    auto fut = task([&](task_builder b) {
        return b.use(resource, [&evt, b](tracked_resource&) {
            return b.bind(evt, [b](int x) { return b.ret(x); });
        });
    });
    REQUIRE(*releases == 0);
    evt.set_value(4);
    REQUIRE(*releases == 1);
    REQUIRE(fut.get_awaiter().get_result() == 4);
}


TEST_CASE("Builder: resumption context", "[Builder]") {
    queued_scheduler sched;
    promise<int> pr;
    future<int> fut;

    SECTION("task builder") {
        {
            scheduler_scope scope(sched);
            fut = task([next = pr.get_future()](task_builder b) {
                return b.bind(next, [b](int x) { return b.ret(x); });
            });
        }
        pr.set_value(1);
        REQUIRE(!fut.ready());
        sched.run_all();
        REQUIRE(fut.ready());
    }
    SECTION("context free task builder") {
        {
            scheduler_scope scope(sched);
            fut = task<context_free_task_builder>([next = pr.get_future()](context_free_task_builder b) {
                return b.bind(next, [b](int x) { return b.ret(x); });
            });
        }
        pr.set_value(1);
        REQUIRE(fut.ready());
        REQUIRE(sched.scheduled() == 0);
    }
}
