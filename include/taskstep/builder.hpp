#pragma once

#include "bind.hpp"
#include "combinators.hpp"
#include "concepts.hpp"
#include "future.hpp"
#include "run.hpp"
#include "state_machine.hpp"
#include "step.hpp"

#include <functional>
#include <type_traits>
#include <utility>


namespace taskstep {

namespace impl_builder {

    template <class T>
    struct is_future : std::false_type {};

    template <class T>
    struct is_future<future<T>> : std::true_type {};

} // namespace impl_builder


// Member-per-combinator façade over one state machine, meant to be the target
// of a mechanical translation from sequential code. Builders are cheap handles:
// closures should capture them by value.
template <bool ContinueOnContext>
class basic_task_builder {
public:
    static constexpr bool continue_on_context = ContinueOnContext;

    explicit basic_task_builder(state_machine& machine) noexcept : m_machine(&machine) {}

    state_machine& machine() const noexcept {
        return *m_machine;
    }

    template <class Code>
    Code delay(Code code) const {
        return code;
    }

    step<unit> zero() const {
        return taskstep::zero();
    }

    template <class T>
    auto ret(T&& value) const {
        return taskstep::ret(std::forward<T>(value));
    }

    template <class T>
    step<T> return_from(future<T> next) const {
        return taskstep::return_from(std::move(next));
    }

    template <awaitable Awaitable>
        requires(!impl_builder::is_future<std::remove_cvref_t<Awaitable>>::value)
    auto return_from(Awaitable&& awaitable) const {
        return taskstep::return_from(*m_machine, std::forward<Awaitable>(awaitable));
    }

    template <awaitable Awaitable, class Continuation>
    auto bind(Awaitable&& awaitable, Continuation continuation) const {
        if constexpr (ContinueOnContext) {
            return taskstep::bind(*m_machine, std::forward<Awaitable>(awaitable), std::move(continuation));
        }
        else {
            return taskstep::bind_context_free(*m_machine, std::forward<Awaitable>(awaitable), std::move(continuation));
        }
    }

    template <class Rest>
    auto combine(step<unit> first, Rest rest) const {
        return taskstep::combine(*m_machine, std::move(first), std::move(rest));
    }

    template <class Condition, class Body>
    step<unit> while_loop(Condition condition, Body body) const {
        return taskstep::while_loop(*m_machine, std::move(condition), std::move(body));
    }

    template <class Sequence, class Body>
    step<unit> for_loop(Sequence&& sequence, Body body) const {
        return taskstep::for_loop(*m_machine, std::forward<Sequence>(sequence), std::move(body));
    }

    template <class Code, class Handler>
    auto try_with(Code code, Handler handler) const {
        return taskstep::try_with(*m_machine, std::move(code), std::move(handler));
    }

    template <class Code, class Compensation>
    auto try_finally(Code code, Compensation compensation) const {
        return taskstep::try_finally(*m_machine, std::move(code), std::move(compensation));
    }

    template <class Resource, class Body>
    auto use(Resource resource, Body body) const {
        return taskstep::use(*m_machine, std::move(resource), std::move(body));
    }

private:
    state_machine* m_machine;
};


using task_builder = basic_task_builder<true>;
using context_free_task_builder = basic_task_builder<false>;


// Runs body with a fresh builder and returns the future of its outcome.
template <class Builder = task_builder, class Body>
auto task(Body&& body) {
    return run([&body](state_machine& machine) {
        return std::invoke(body, Builder(machine));
    });
}

} // namespace taskstep
