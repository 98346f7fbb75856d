#pragma once

#include "concepts.hpp"
#include "future.hpp"
#include "result.hpp"

#include <cassert>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <variant>


namespace taskstep {

// Identifies a resumable point of one state machine.
enum class label : size_t {};


// Completion notification of whatever a step is suspended on.
struct basic_awaiter {
    virtual ~basic_awaiter() = default;
    virtual void on_completed(std::function<void()> callback) = 0;
};


template <awaiter Awaiter>
struct erased_awaiter : basic_awaiter {
    Awaiter m_awaiter;

    explicit erased_awaiter(Awaiter awaiter) : m_awaiter(std::move(awaiter)) {}

    void on_completed(std::function<void()> callback) override {
        m_awaiter.on_completed(std::move(callback));
    }
};


template <awaiter Awaiter>
auto erase_awaiter(Awaiter awaiter) {
    return std::make_shared<erased_awaiter<Awaiter>>(std::move(awaiter));
}


// The outcome of running a piece of the state machine synchronously: either
// the final value, a hand-off to another future, or a suspension that resumes
// at a label once the awaiter completes.
template <class T>
class step {
    struct await_point {
        std::shared_ptr<basic_awaiter> m_awaiter;
        label m_resume_point;
    };

    static constexpr size_t RETURN = 0;
    static constexpr size_t RETURN_FROM = 1;
    static constexpr size_t AWAIT = 2;

    template <size_t Index, class... Args>
    explicit step(std::in_place_index_t<Index> index, Args&&... args) : m_data(index, std::forward<Args>(args)...) {}

public:
    using value_type = T;

    static step ret(T value) {
        return step(std::in_place_index<RETURN>, std::move(value));
    }

    static step return_from(future<T> next) {
        assert(next.valid());
        return step(std::in_place_index<RETURN_FROM>, std::move(next));
    }

    static step await(std::shared_ptr<basic_awaiter> awaiter, label resume_point) {
        assert(awaiter);
        return step(std::in_place_index<AWAIT>, await_point{ std::move(awaiter), resume_point });
    }

    bool is_return() const noexcept {
        return m_data.index() == RETURN;
    }

    bool is_return_from() const noexcept {
        return m_data.index() == RETURN_FROM;
    }

    bool is_await() const noexcept {
        return m_data.index() == AWAIT;
    }

    T& get_result() {
        return checked_get<RETURN>();
    }

    const T& get_result() const {
        return checked_get<RETURN>();
    }

    const future<T>& get_next_future() const {
        return checked_get<RETURN_FROM>();
    }

    const std::shared_ptr<basic_awaiter>& get_awaiter() const {
        return checked_get<AWAIT>().m_awaiter;
    }

    label get_resume_point() const {
        return checked_get<AWAIT>().m_resume_point;
    }

private:
    template <size_t Index>
    auto& checked_get() const {
        const auto ptr = std::get_if<Index>(&m_data);
        if (ptr == nullptr) {
            assert(false && "step accessed as a different variant");
            std::terminate();
        }
        return *ptr;
    }

    template <size_t Index>
    auto& checked_get() {
        const auto ptr = std::get_if<Index>(&m_data);
        if (ptr == nullptr) {
            assert(false && "step accessed as a different variant");
            std::terminate();
        }
        return *ptr;
    }

private:
    std::variant<T, future<T>, await_point> m_data;
};


template <class Step>
struct step_traits {};


template <class T>
struct step_traits<step<T>> {
    using value_type = T;
};


template <class Step>
using step_value_t = typename step_traits<std::remove_cvref_t<Step>>::value_type;

} // namespace taskstep
