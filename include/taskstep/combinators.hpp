#pragma once

#include "bind.hpp"
#include "concepts.hpp"
#include "future.hpp"
#include "profiler.hpp"
#include "result.hpp"
#include "sequence.hpp"
#include "state_machine.hpp"
#include "step.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>


namespace taskstep {

namespace impl_combinators {

    template <class Code>
    using code_step_t = std::invoke_result_t<Code&>;

    template <class Code>
    using code_value_t = step_value_t<code_step_t<Code>>;

} // namespace impl_combinators


inline step<unit> zero() {
    return step<unit>::ret(unit{});
}


template <class T>
step<std::decay_t<T>> ret(T&& value) {
    return step<std::decay_t<T>>::ret(std::forward<T>(value));
}


template <class T>
step<T> return_from(future<T> next) {
    return step<T>::return_from(std::move(next));
}


// Returns the result of any awaitable, not just a future.
template <awaitable Awaitable>
    requires(!std::is_void_v<await_result_t<Awaitable>>)
auto return_from(state_machine& machine, Awaitable&& awaitable) {
    using value_type = await_result_t<Awaitable>;
    return taskstep::bind(machine, std::forward<Awaitable>(awaitable), [](const value_type& value) {
        return step<value_type>::ret(value);
    });
}


// Sequences a unit step with the rest of the computation. Requiring a unit
// first step rules out two returns in a row.
template <class Rest>
auto combine(state_machine& machine, step<unit> first, Rest rest) -> impl_combinators::code_step_t<Rest> {
    using step_type = impl_combinators::code_step_t<Rest>;
    using value_type = impl_combinators::code_value_t<Rest>;

    const auto current = std::make_shared<step<unit>>(std::move(first));
    const auto cont = machine.allocate_label();
    const auto entry = machine.allocate_label();

    machine.set_code(entry, [&machine, current, cont, entry]() -> step_type {
        if (current->is_return()) {
            return machine.jump<value_type>(cont);
        }
        if (current->is_return_from()) {
            const auto next = erase_awaiter(current->get_next_future().get_awaiter());
            return step_type::await(next, machine.code([&machine, next, cont]() -> step_type {
                next->m_awaiter.get_result(); // Rethrows if the future failed.
                return machine.jump<value_type>(cont);
            }));
        }
        // The first step suspended: resume it in place, then re-evaluate.
        const auto resume_point = current->get_resume_point();
        return step_type::await(current->get_awaiter(), machine.code([&machine, current, resume_point, entry]() -> step_type {
            *current = machine.jump<unit>(resume_point);
            return machine.jump<value_type>(entry);
        }));
    });
    machine.set_code(cont, [rest]() mutable -> step_type {
        return rest();
    });

    return machine.jump<value_type>(entry);
}


template <class Condition, class Body>
step<unit> while_loop(state_machine& machine, Condition condition, Body body) {
    const auto entry = machine.allocate_label();
    machine.set_code(entry, [&machine, entry, condition, body]() mutable -> step<unit> {
        if (condition()) {
            return combine(machine, body(), [&machine, entry] { return machine.jump<unit>(entry); });
        }
        return zero();
    });
    return machine.jump<unit>(entry);
}


// Catches exceptions thrown both while producing the inner steps and while
// retrieving the result of a handed-off future.
template <class Code, class Handler>
auto try_with(state_machine& machine, Code code, Handler handler) -> impl_combinators::code_step_t<Code> {
    using step_type = impl_combinators::code_step_t<Code>;
    using value_type = impl_combinators::code_value_t<Code>;
    static_assert(std::is_same_v<std::invoke_result_t<Handler&, std::exception_ptr>, step_type>,
                  "handler must return the same step type as the protected code");

    // Resuming must go through entry again to stay inside the try block.
    const auto inner = std::make_shared<label>(machine.code(std::move(code)));
    const auto entry = machine.allocate_label();

    machine.set_code(entry, [&machine, inner, entry, handler]() mutable -> step_type {
        try {
            auto current = machine.jump<value_type>(*inner);
            if (current.is_return()) {
                return current;
            }
            if (current.is_return_from()) {
                const auto next = erase_awaiter(current.get_next_future().get_awaiter());
                return step_type::await(next, machine.code([next, handler]() mutable -> step_type {
                    try {
                        return step_type::ret(next->m_awaiter.get_result());
                    }
                    catch (...) {
                        return handler(std::current_exception());
                    }
                }));
            }
            const auto resume_point = current.get_resume_point();
            return step_type::await(current.get_awaiter(), machine.code([&machine, inner, resume_point, entry]() -> step_type {
                *inner = resume_point;
                return machine.jump<value_type>(entry);
            }));
        }
        catch (...) {
            return handler(std::current_exception());
        }
    });

    return machine.jump<value_type>(entry);
}


// Runs compensation exactly once when code finishes, whether by returning, by
// handing off to a future that later settles, or by throwing. Suspending does
// not count as finishing.
template <class Code, class Compensation>
auto try_finally(state_machine& machine, Code code, Compensation compensation) -> impl_combinators::code_step_t<Code> {
    using step_type = impl_combinators::code_step_t<Code>;
    using value_type = impl_combinators::code_value_t<Code>;

    const auto inner = std::make_shared<label>(machine.code(std::move(code)));
    const auto entry = machine.allocate_label();

    machine.set_code(entry, [&machine, inner, entry, compensation]() mutable -> step_type {
        std::optional<step_type> current;
        try {
            current.emplace(machine.jump<value_type>(*inner));
        }
        catch (...) {
            compensation();
            throw;
        }

        if (current->is_return()) {
            compensation();
            return std::move(*current);
        }
        if (current->is_return_from()) {
            const auto next = erase_awaiter(current->get_next_future().get_awaiter());
            return step_type::await(next, machine.code([next, compensation]() mutable -> step_type {
                std::optional<step_type> result;
                try {
                    result.emplace(step_type::ret(next->m_awaiter.get_result()));
                }
                catch (...) {
                    compensation();
                    throw;
                }
                compensation();
                return std::move(*result);
            }));
        }
        const auto resume_point = current->get_resume_point();
        return step_type::await(current->get_awaiter(), machine.code([&machine, inner, resume_point, entry]() -> step_type {
            *inner = resume_point;
            return machine.jump<value_type>(entry);
        }));
    });

    return machine.jump<value_type>(entry);
}


template <class Resource>
void release(Resource& resource) {
    if constexpr (disposable_handle<Resource>) {
        if (resource) {
            resource->dispose();
        }
    }
    else if constexpr (disposable<Resource>) {
        resource.dispose();
    }
}


// Releases the resource once body is done. Empty handles are not released.
template <class Resource, class Body>
auto use(state_machine& machine, Resource resource, Body body) -> std::invoke_result_t<Body&, Resource&> {
    const auto owned = std::make_shared<Resource>(std::move(resource));
    return try_finally(
        machine,
        [owned, body]() mutable { return body(*owned); },
        [owned] { release(*owned); });
}


template <class Sequence, class Body>
step<unit> for_loop(state_machine& machine, Sequence&& sequence, Body body) {
    return use(machine, make_enumerator(std::forward<Sequence>(sequence)), [&machine, body](auto& items) {
        return while_loop(
            machine,
            [&items] { return static_cast<bool>(items.move_next()); },
            [&items, body]() mutable { return body(items.current()); });
    });
}

} // namespace taskstep
