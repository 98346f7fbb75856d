#include "helper_awaitables.hpp"

#include <taskstep/combinators.hpp>
#include <taskstep/future.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>


using namespace taskstep;


TEST_CASE("Combinators: zero and ret", "[Combinators]") {
    REQUIRE(zero().is_return());
    REQUIRE(zero().get_result() == unit{});
    REQUIRE(ret(std::string("x")).get_result() == "x");
}


TEST_CASE("Combinators: combine", "[Combinators]") {
    state_machine machine;
    int rest_calls = 0;
    const auto rest = [&rest_calls] {
        ++rest_calls;
        return ret(10);
    };

    SECTION("return") {
        auto s = combine(machine, zero(), rest);
        REQUIRE(s.is_return());
        REQUIRE(s.get_result() == rest().get_result());
        REQUIRE(rest_calls == 2);
    }
    SECTION("return from ready future") {
        auto s = combine(machine, return_from(make_ready_future(unit{})), rest);
        REQUIRE(s.is_await());
        REQUIRE(rest_calls == 0);
        REQUIRE(machine.jump<int>(s.get_resume_point()).get_result() == 10);
        REQUIRE(rest_calls == 1);
    }
    SECTION("return from failed future") {
        auto failed = make_exceptional_future<unit>(std::make_exception_ptr(std::runtime_error("test")));
        auto s = combine(machine, return_from(failed), rest);
        REQUIRE_THROWS_AS(machine.jump<int>(s.get_resume_point()), std::runtime_error);
        REQUIRE(rest_calls == 0);
    }
    SECTION("await") {
        manual_event<void> evt;
        auto s = combine(machine, bind(machine, evt, [] { return zero(); }), rest);
        REQUIRE(s.is_await());
        REQUIRE(rest_calls == 0);
        evt.set_value();
        REQUIRE(machine.jump<int>(s.get_resume_point()).get_result() == 10);
        REQUIRE(rest_calls == 1);
    }
}


TEST_CASE("Combinators: while loop", "[Combinators]") {
    state_machine machine;
    std::vector<int> visited;
    int i = 0;
    auto s = while_loop(
        machine,
        [&i] { return i < 5; },
        [&] {
            visited.push_back(i++);
            return zero();
        });
    REQUIRE(s.is_return());
    REQUIRE(visited == std::vector{ 0, 1, 2, 3, 4 });
}


TEST_CASE("Combinators: while loop never entered", "[Combinators]") {
    state_machine machine;
    int calls = 0;
    auto s = while_loop(
        machine,
        [] { return false; },
        [&calls] {
            ++calls;
            return zero();
        });
    REQUIRE(s.is_return());
    REQUIRE(calls == 0);
}


TEST_CASE("Combinators: try with", "[Combinators]") {
    state_machine machine;
    int handled = 0;
    const auto handler = [&handled](std::exception_ptr ex) {
        ++handled;
        try {
            std::rethrow_exception(ex);
        }
        catch (std::runtime_error& err) {
            return ret(std::string(err.what()));
        }
    };

    SECTION("no exception") {
        auto s = try_with(machine, [] { return ret(std::string("value")); }, handler);
        REQUIRE(s.get_result() == "value");
        REQUIRE(handled == 0);
    }
    SECTION("synchronous throw") {
        auto s = try_with(
            machine, []() -> step<std::string> { throw std::runtime_error("sync"); }, handler);
        REQUIRE(s.get_result() == "sync");
        REQUIRE(handled == 1);
    }
    SECTION("failed hand-off") {
        auto failed = make_exceptional_future<std::string>(std::make_exception_ptr(std::runtime_error("async")));
        auto s = try_with(machine, [failed] { return return_from(failed); }, handler);
        REQUIRE(s.is_await());
        REQUIRE(machine.jump<std::string>(s.get_resume_point()).get_result() == "async");
        REQUIRE(handled == 1);
    }
    SECTION("handler rethrows") {
        auto s = [&] {
            return try_with(
                machine,
                []() -> step<int> { throw std::runtime_error("sync"); },
                [](std::exception_ptr ex) -> step<int> { std::rethrow_exception(ex); });
        };
        REQUIRE_THROWS_AS(s(), std::runtime_error);
    }
}


TEST_CASE("Combinators: try finally", "[Combinators]") {
    state_machine machine;
    int compensations = 0;
    const auto compensation = [&compensations] { ++compensations; };

    SECTION("return") {
        auto s = try_finally(machine, [] { return ret(1); }, compensation);
        REQUIRE(s.get_result() == 1);
        REQUIRE(compensations == 1);
    }
    SECTION("synchronous throw") {
        REQUIRE_THROWS_AS(try_finally(
                              machine, []() -> step<int> { throw std::runtime_error("test"); }, compensation),
                          std::runtime_error);
        REQUIRE(compensations == 1);
    }
    SECTION("hand-off") {
        promise<int> pr;
        auto s = try_finally(machine, [next = pr.get_future()] { return return_from(next); }, compensation);
        REQUIRE(s.is_await());
        REQUIRE(compensations == 0);
        pr.set_value(3);
        REQUIRE(machine.jump<int>(s.get_resume_point()).get_result() == 3);
        REQUIRE(compensations == 1);
    }
    SECTION("failed hand-off runs compensation before propagating") {
        promise<int> pr;
        auto s = try_finally(machine, [next = pr.get_future()] { return return_from(next); }, compensation);
        pr.set_exception(std::make_exception_ptr(std::runtime_error("test")));
        bool compensated_before = false;
        try {
            (void)machine.jump<int>(s.get_resume_point());
        }
        catch (std::runtime_error&) {
            compensated_before = compensations == 1;
        }
        REQUIRE(compensated_before);
        REQUIRE(compensations == 1);
    }
    SECTION("throwing compensation") {
        const auto throwing = [&compensations] {
            ++compensations;
            throw std::logic_error("compensation");
        };
        REQUIRE_THROWS_AS(try_finally(machine, [] { return ret(1); }, throwing), std::logic_error);
        REQUIRE(compensations == 1);
    }
}


TEST_CASE("Combinators: use", "[Combinators]") {
    state_machine machine;

    SECTION("disposable") {
        tracked_resource resource;
        const auto releases = resource.releases;
        size_t releases_in_body = 0;
        auto s = use(machine, resource, [&](tracked_resource& r) {
            releases_in_body = *r.releases;
            return ret(5);
        });
        REQUIRE(s.get_result() == 5);
        REQUIRE(releases_in_body == 0);
        REQUIRE(*releases == 1);
    }
    SECTION("handle") {
        const auto resource = std::make_shared<tracked_resource>();
        auto s = use(machine, resource, [](auto&) { return zero(); });
        REQUIRE(s.is_return());
        REQUIRE(*resource->releases == 1);
    }
    SECTION("empty handle") {
        std::shared_ptr<tracked_resource> resource;
        auto s = use(machine, resource, [](auto&) { return zero(); });
        REQUIRE(s.is_return());
    }
    SECTION("body throws") {
        tracked_resource resource;
        const auto releases = resource.releases;
        REQUIRE_THROWS_AS(use(machine, resource, [](auto&) -> step<unit> { throw std::runtime_error("test"); }),
                          std::runtime_error);
        REQUIRE(*releases == 1);
    }
}


TEST_CASE("Combinators: for loop", "[Combinators]") {
    state_machine machine;
    int sum = 0;
    const auto body = [&sum](int x) {
        sum += x;
        return zero();
    };

    SECTION("range") {
        std::vector<int> items = { 1, 2, 3 };
        auto s = for_loop(machine, items, body);
        REQUIRE(s.is_return());
        REQUIRE(sum == 6);
    }
    SECTION("temporary range") {
        auto s = for_loop(machine, std::vector<int>{ 4, 5 }, body);
        REQUIRE(s.is_return());
        REQUIRE(sum == 9);
    }
    SECTION("empty range") {
        auto s = for_loop(machine, std::vector<int>{}, body);
        REQUIRE(s.is_return());
        REQUIRE(sum == 0);
    }
    SECTION("enumerable") {
        counting_sequence sequence({ 1, 2, 3 });
        auto s = for_loop(machine, sequence, body);
        REQUIRE(s.is_return());
        REQUIRE(sum == 6);
        REQUIRE(sequence.get_counters().queries == 4);
        REQUIRE(sequence.get_counters().disposals == 1);
    }
}
