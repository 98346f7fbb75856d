#pragma once

#include "container/atomic_collection.hpp"
#include "memory/rc_ptr.hpp"
#include "result.hpp"
#include "scheduler.hpp"

#include <atomic>
#include <cassert>
#include <exception>
#include <functional>
#include <future>
#include <stdexcept>
#include <type_traits>
#include <utility>


namespace taskstep {

template <class T>
class future;

template <class T>
class promise;


namespace impl_future {

    struct continuation : schedulable {
        std::function<void()> m_callback;
        scheduler* m_context = nullptr;
        continuation* m_next = nullptr;

        continuation(std::function<void()> callback, scheduler* context)
            : m_callback(std::move(callback)), m_context(context) {}

        void dispatch() noexcept {
            m_context ? m_context->schedule(*this) : resume();
        }

        // Completion callbacks must not throw.
        void resume() noexcept override {
            auto callback = std::move(m_callback);
            delete this;
            callback();
        }
    };


    template <class T>
    struct shared_state : rc_from_this {
        task_result<T> m_result;
        std::atomic_flag m_claimed;
        atomic_collection<continuation, &continuation::m_next> m_continuations;

        shared_state() = default;
        shared_state(const shared_state&) = delete;
        shared_state& operator=(const shared_state&) = delete;

        ~shared_state() {
            auto item = m_continuations.detach();
            if (!m_continuations.closed(item)) {
                while (item != nullptr) {
                    delete std::exchange(item, item->m_next);
                }
            }
        }

        void destroy() noexcept {
            delete this;
        }

        bool ready() const noexcept {
            return m_continuations.closed();
        }

        // Only one producer may claim the state, the claimant must complete it.
        bool try_claim() noexcept {
            return !m_claimed.test_and_set(std::memory_order_relaxed);
        }

        void complete(task_result<T> result) noexcept {
            m_result = std::move(result);
            // Notify in registration order.
            continuation* reversed = nullptr;
            auto item = m_continuations.close();
            while (item != nullptr) {
                const auto next = item->m_next;
                item->m_next = std::exchange(reversed, item);
                item = next;
            }
            while (reversed != nullptr) {
                const auto next = reversed->m_next;
                reversed->dispatch();
                reversed = next;
            }
        }

        void subscribe(std::function<void()> callback, scheduler* context) {
            const auto item = new continuation(std::move(callback), context);
            const auto previous = m_continuations.push(item);
            if (m_continuations.closed(previous)) {
                item->dispatch();
            }
        }
    };

} // namespace impl_future


template <class T>
class future_awaiter {
public:
    future_awaiter(rc_ptr<impl_future::shared_state<T>> state, bool continue_on_context) noexcept
        : m_state(std::move(state)), m_continue_on_context(continue_on_context) {
        assert(m_state);
    }

    bool is_completed() const noexcept {
        return m_state->ready();
    }

    const T& get_result() const {
        assert(is_completed());
        return m_state->m_result.get_or_throw();
    }

    // The callback runs exactly once. When continuing on context, it is posted
    // to the scheduler that is current on the registering thread, if any.
    void on_completed(std::function<void()> callback) const {
        m_state->subscribe(std::move(callback), m_continue_on_context ? scheduler::current() : nullptr);
    }

    bool continues_on_context() const noexcept {
        return m_continue_on_context;
    }

private:
    rc_ptr<impl_future::shared_state<T>> m_state;
    bool m_continue_on_context = true;
};


template <class T>
class configured_future {
public:
    configured_future(rc_ptr<impl_future::shared_state<T>> state, bool continue_on_context) noexcept
        : m_state(std::move(state)), m_continue_on_context(continue_on_context) {}

    future_awaiter<T> get_awaiter() const {
        return { m_state, m_continue_on_context };
    }

private:
    rc_ptr<impl_future::shared_state<T>> m_state;
    bool m_continue_on_context = true;
};


template <class T>
class [[nodiscard]] future {
    friend class promise<T>;

public:
    using value_type = T;

    future() = default;
    explicit future(rc_ptr<impl_future::shared_state<T>> state) noexcept : m_state(std::move(state)) {}

    bool valid() const noexcept {
        return !!m_state;
    }

    bool ready() const {
        assert(valid());
        return m_state->ready();
    }

    future_awaiter<T> get_awaiter() const {
        assert(valid());
        return { m_state, true };
    }

    configured_future<T> configure_await(bool continue_on_context) const {
        assert(valid());
        return { m_state, continue_on_context };
    }

    bool operator==(const future& other) const noexcept {
        return m_state == other.m_state;
    }

private:
    rc_ptr<impl_future::shared_state<T>> m_state;
};


template <class T>
class promise {
public:
    promise() : m_state(new impl_future::shared_state<T>()) {}
    promise(const promise&) = delete;
    promise& operator=(const promise&) = delete;
    promise(promise&& other) noexcept = default;
    promise& operator=(promise&& other) noexcept {
        if (this != &other) {
            abandon();
            m_state = std::move(other.m_state);
        }
        return *this;
    }
    ~promise() {
        abandon();
    }

    future<T> get_future() const {
        assert(m_state);
        return future<T>(m_state);
    }

    void set_value(T value) {
        set_result(task_result<T>(std::move(value)));
    }

    void set_exception(std::exception_ptr ex) {
        set_result(task_result<T>(std::move(ex)));
    }

    void set_result(task_result<T> result) {
        assert(m_state);
        if (!m_state->try_claim()) {
            throw std::invalid_argument("promise already satisfied");
        }
        m_state->complete(std::move(result));
    }

    // Completes the promise with the outcome of source once source completes.
    void set_from(const future<T>& source) {
        assert(m_state);
        assert(source.valid());
        if (!m_state->try_claim()) {
            throw std::invalid_argument("promise already satisfied");
        }
        const auto& state = source.m_state;
        state->subscribe([target = m_state, state] { target->complete(state->m_result); }, nullptr);
    }

private:
    void abandon() noexcept {
        if (m_state && m_state->try_claim()) {
            m_state->complete(task_result<T>(std::make_exception_ptr(std::future_error(std::future_errc::broken_promise))));
        }
    }

private:
    rc_ptr<impl_future::shared_state<T>> m_state;
};


template <class T>
future<std::decay_t<T>> make_ready_future(T&& value) {
    promise<std::decay_t<T>> pr;
    pr.set_value(std::forward<T>(value));
    return pr.get_future();
}


template <class T>
future<T> make_exceptional_future(std::exception_ptr ex) {
    promise<T> pr;
    pr.set_exception(std::move(ex));
    return pr.get_future();
}

} // namespace taskstep
