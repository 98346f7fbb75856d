#include <taskstep/scheduler.hpp>

#include <utility>


namespace taskstep {

namespace {
    thread_local scheduler* current_scheduler = nullptr;
} // namespace


scheduler* scheduler::current() noexcept {
    return current_scheduler;
}


scheduler_scope::scheduler_scope(scheduler& sched) noexcept
    : m_previous(std::exchange(current_scheduler, &sched)) {}


scheduler_scope::~scheduler_scope() {
    current_scheduler = m_previous;
}

} // namespace taskstep
