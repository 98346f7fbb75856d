#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>


namespace taskstep {

// clang-format off

template <class A>
concept awaiter = requires(A& a, std::function<void()> callback) {
    { a.is_completed() } -> std::convertible_to<bool>;
    { a.get_result() };
    { a.on_completed(std::move(callback)) };
};


template <class T>
concept awaitable = requires(std::remove_reference_t<T>& t) {
    { t.get_awaiter() } -> awaiter;
};


template <class T>
concept context_configurable = requires(std::remove_reference_t<T>& t) {
    { t.configure_await(false) } -> awaitable;
};


template <class E>
concept enumerator = requires(E& e) {
    { e.move_next() } -> std::convertible_to<bool>;
    { e.current() };
};


template <class S>
concept enumerable = requires(std::remove_reference_t<S>& s) {
    { s.get_enumerator() } -> enumerator;
};


template <class R>
concept disposable = requires(R& r) {
    { r.dispose() };
};


template <class R>
concept disposable_handle = requires(R& r) {
    { static_cast<bool>(r) };
    { r->dispose() };
};

// clang-format on


template <awaitable T>
using awaiter_t = std::remove_cvref_t<decltype(std::declval<std::remove_reference_t<T>&>().get_awaiter())>;


template <awaitable T>
using await_result_t = std::remove_cvref_t<decltype(std::declval<awaiter_t<T>&>().get_result())>;

} // namespace taskstep
