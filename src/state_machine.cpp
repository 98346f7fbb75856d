#include <taskstep/state_machine.hpp>


namespace taskstep {

label state_machine::allocate_label() {
    const auto index = m_slots.size();
    m_slots.emplace_back();
    return static_cast<label>(index);
}


size_t state_machine::size() const noexcept {
    return m_slots.size();
}


bool state_machine::installed(label target) const noexcept {
    const auto index = static_cast<size_t>(target);
    return index < m_slots.size() && m_slots[index].m_type != nullptr;
}


state_machine::slot& state_machine::get_slot(label target) {
    const auto index = static_cast<size_t>(target);
    if (index >= m_slots.size()) {
        assert(false && "label does not belong to this state machine");
        std::terminate();
    }
    return m_slots[index];
}

} // namespace taskstep
