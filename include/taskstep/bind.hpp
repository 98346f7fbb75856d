#pragma once

#include "concepts.hpp"
#include "profiler.hpp"
#include "state_machine.hpp"
#include "step.hpp"

#include <type_traits>
#include <utility>


namespace taskstep {

namespace impl_bind {

    template <class Awaiter, class Continuation>
    auto resume_with_result(Awaiter& awaiter, Continuation& continuation) {
        if constexpr (std::is_void_v<decltype(awaiter.get_result())>) {
            awaiter.get_result();
            return continuation();
        }
        else {
            return continuation(awaiter.get_result());
        }
    }


    template <class Awaitable, class Continuation>
    using bound_step_t = decltype(resume_with_result(std::declval<awaiter_t<Awaitable>&>(), std::declval<Continuation&>()));

} // namespace impl_bind


// Continues with the result of an awaitable. When the awaitable has already
// completed, the continuation runs right away on the calling stack. Otherwise
// the continuation gets its own label and the returned step suspends on the
// awaiter.
template <awaitable Awaitable, class Continuation>
auto bind(state_machine& machine, Awaitable&& awaitable, Continuation continuation)
    -> impl_bind::bound_step_t<Awaitable, Continuation> {
    using step_type = impl_bind::bound_step_t<Awaitable, Continuation>;
    static_assert(std::is_same_v<step_type, step<step_value_t<step_type>>>, "continuation must return a step");
    TASKSTEP_PROFILE_SCOPE();

    auto awaiter = awaitable.get_awaiter();
    if (awaiter.is_completed()) {
        return impl_bind::resume_with_result(awaiter, continuation);
    }
    const auto erased = erase_awaiter(std::move(awaiter));
    const auto resume_point = machine.code([erased, continuation]() mutable -> step_type {
        return impl_bind::resume_with_result(erased->m_awaiter, continuation);
    });
    return step_type::await(erased, resume_point);
}


// Same as bind, but the continuation does not have to resume on the
// awaiting thread's scheduler.
template <awaitable Awaitable, class Continuation>
auto bind_context_free(state_machine& machine, Awaitable&& awaitable, Continuation continuation) {
    if constexpr (context_configurable<Awaitable>) {
        return taskstep::bind(machine, awaitable.configure_await(false), std::move(continuation));
    }
    else {
        return taskstep::bind(machine, std::forward<Awaitable>(awaitable), std::move(continuation));
    }
}

} // namespace taskstep
