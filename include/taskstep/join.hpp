#pragma once

#include "concepts.hpp"

#include <future>
#include <memory>
#include <type_traits>
#include <utility>


namespace taskstep {

namespace impl_join {

    template <class Awaitable>
    auto get_context_free_awaiter(Awaitable& object) {
        if constexpr (context_configurable<Awaitable>) {
            return object.configure_await(false).get_awaiter();
        }
        else {
            return object.get_awaiter();
        }
    }

} // namespace impl_join


// Blocks the calling thread until the awaitable completes. Must not be called
// from the only thread that can complete the awaitable.
template <awaitable Awaitable>
auto join(Awaitable&& object) -> await_result_t<Awaitable> {
    using T = await_result_t<Awaitable>;
    auto awaiter = impl_join::get_context_free_awaiter(object);
    if (!awaiter.is_completed()) {
        const auto signal = std::make_shared<std::promise<void>>();
        auto completed = signal->get_future();
        awaiter.on_completed([signal] { signal->set_value(); });
        completed.wait();
    }
    if constexpr (std::is_void_v<T>) {
        awaiter.get_result();
    }
    else {
        return T(awaiter.get_result());
    }
}

} // namespace taskstep
