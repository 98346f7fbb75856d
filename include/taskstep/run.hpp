#pragma once

#include "future.hpp"
#include "memory/rc_ptr.hpp"
#include "profiler.hpp"
#include "state_machine.hpp"
#include "step.hpp"

#include <cassert>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>


namespace taskstep {

namespace impl_run {

    enum class driver_state {
        not_started,
        running,
        suspended,
        fulfilled,
        faulted,
    };


    // Advances a suspended step graph each time the awaiter it is suspended on
    // completes. Only one advance runs at a time: the next one is started by the
    // completion callback registered by the previous one.
    template <class T>
    class driver : public rc_from_this {
    public:
        driver(std::unique_ptr<state_machine> machine, step<T> first)
            : m_machine(std::move(machine)),
              m_first(std::move(first)),
              m_resume_point(m_first->get_resume_point()) {
            assert(m_machine);
        }

        driver(const driver&) = delete;
        driver& operator=(const driver&) = delete;

        future<T> get_future() const {
            return m_promise.get_future();
        }

        static void advance(rc_ptr<driver> self) noexcept {
            TASKSTEP_PROFILE_SCOPE();
            auto& d = *self;
            assert(d.m_state == driver_state::not_started || d.m_state == driver_state::suspended);
            d.m_state = driver_state::running;
            try {
                auto current = d.next_step();
                if (current.is_return()) {
                    d.m_state = driver_state::fulfilled;
                    d.m_promise.set_value(std::move(current.get_result()));
                }
                else if (current.is_return_from()) {
                    d.m_state = driver_state::fulfilled;
                    d.m_promise.set_from(current.get_next_future());
                }
                else {
                    TASKSTEP_ATTACH_NOTE("suspend at", static_cast<size_t>(current.get_resume_point()));
                    d.m_resume_point = current.get_resume_point();
                    d.m_state = driver_state::suspended;
                    // The callback may run before on_completed returns.
                    current.get_awaiter()->on_completed([self] { advance(self); });
                }
            }
            catch (...) {
                d.m_state = driver_state::faulted;
                d.m_promise.set_exception(std::current_exception());
            }
        }

        void destroy() noexcept {
            delete this;
        }

    private:
        step<T> next_step() {
            if (m_first) {
                auto first = std::move(*m_first);
                m_first.reset();
                return first;
            }
            return m_machine->jump<T>(m_resume_point);
        }

    private:
        std::unique_ptr<state_machine> m_machine;
        std::optional<step<T>> m_first;
        label m_resume_point;
        promise<T> m_promise;
        driver_state m_state = driver_state::not_started;
    };

} // namespace impl_run


template <class Code>
using run_result_t = step_value_t<std::invoke_result_t<Code&, state_machine&>>;


// Turns a step graph into a future. Code receives the state machine that all
// combinators of the computation share and produces the first step.
//
// A first step that returns yields a ready future, a first step that hands off
// to a future yields that very future. Only a suspending first step allocates
// a driver. Exceptions never escape: they fault the returned future.
template <class Code>
future<run_result_t<Code>> run(Code&& code) {
    using value_type = run_result_t<Code>;
    TASKSTEP_PROFILE_SCOPE();

    try {
        // Continuations refer to the machine by address, so it cannot live on this stack frame.
        auto machine = std::make_unique<state_machine>();
        auto first = std::invoke(code, *machine);
        if (first.is_return()) {
            return make_ready_future(std::move(first.get_result()));
        }
        if (first.is_return_from()) {
            return first.get_next_future();
        }
        rc_ptr runner(new impl_run::driver<value_type>(std::move(machine), std::move(first)));
        auto result = runner->get_future();
        impl_run::driver<value_type>::advance(std::move(runner));
        return result;
    }
    catch (...) {
        return make_exceptional_future<value_type>(std::current_exception());
    }
}

} // namespace taskstep
