#pragma once

#include <compare>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>


namespace taskstep {

// Result of a computation that has no value, e.g. the implicit else branch of an if.
struct unit {
    constexpr auto operator<=>(const unit&) const noexcept = default;
};


template <class T>
struct task_result {
    static_assert(std::is_object_v<T>, "results must be object types, use unit instead of void");

    using value_type = T;
    using reference = std::add_lvalue_reference_t<T>;

    std::optional<std::variant<value_type, std::exception_ptr>> m_result;

    task_result() = default;
    explicit task_result(value_type value) : m_result(std::in_place, std::in_place_index<0>, std::move(value)) {}
    explicit task_result(std::exception_ptr value) : m_result(std::in_place, std::in_place_index<1>, std::move(value)) {}

    reference get_or_throw() {
        auto& value = m_result.value(); // Throws if empty.
        if (value.index() == 1) {
            std::rethrow_exception(std::get<1>(value));
        }
        return std::get<0>(value);
    }
};

} // namespace taskstep
