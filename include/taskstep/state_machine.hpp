#pragma once

#include "profiler.hpp"
#include "step.hpp"

#include <any>
#include <cassert>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <type_traits>
#include <typeinfo>
#include <utility>


namespace taskstep {

// Label table shared by all combinators of one task expression.
//
// Each label maps to a type-erased continuation producing a step<T>. Labels
// are handed out densely from zero and never reused. Slots keep their address
// while the table grows, so a continuation may allocate and install labels
// while it is running.
class state_machine {
    struct slot {
        std::function<std::any()> m_code;
        const std::type_info* m_type = nullptr;
    };

public:
    state_machine() = default;
    state_machine(const state_machine&) = delete;
    state_machine(state_machine&&) = delete;
    state_machine& operator=(const state_machine&) = delete;
    state_machine& operator=(state_machine&&) = delete;

    label allocate_label();

    // Installs or replaces the continuation of a label. Code must return a step<T> by value.
    template <class Code>
    void set_code(label target, Code code);

    template <class Code>
    label code(Code code);

    // Runs the continuation installed at target. Jumping with a different T than the
    // continuation was installed with is a defect and terminates the program.
    template <class T>
    step<T> jump(label target);

    size_t size() const noexcept;
    bool installed(label target) const noexcept;

private:
    slot& get_slot(label target);

private:
    std::deque<slot> m_slots;
};


template <class Code>
void state_machine::set_code(label target, Code code) {
    using step_type = std::invoke_result_t<Code&>;
    using value_type = step_value_t<step_type>;
    static_assert(std::is_same_v<step_type, step<value_type>>, "label code must return a step by value");

    auto& s = get_slot(target);
    s.m_code = [code = std::move(code)]() mutable -> std::any {
        return std::any(std::in_place_type<step<value_type>>, code());
    };
    s.m_type = &typeid(step<value_type>);
}


template <class Code>
label state_machine::code(Code code) {
    const auto target = allocate_label();
    set_code(target, std::move(code));
    return target;
}


template <class T>
step<T> state_machine::jump(label target) {
    TASKSTEP_PROFILE_SCOPE();
    TASKSTEP_ATTACH_NOTE("label", static_cast<size_t>(target));
    auto& s = get_slot(target);
    if (s.m_type == nullptr || *s.m_type != typeid(step<T>)) {
        assert(false && "label jumped to with a step type it was not installed with");
        std::terminate();
    }
    auto result = s.m_code();
    return std::any_cast<step<T>>(std::move(result));
}

} // namespace taskstep
