#pragma once


namespace taskstep {

class scheduler;


struct schedulable {
    virtual ~schedulable() = default;
    virtual void resume() noexcept = 0;
    schedulable* m_scheduler_next = nullptr;
};


// Resumption context. Awaiters that continue on context capture the calling
// thread's current scheduler when a callback is registered, and completion
// posts the callback to it instead of running it on the completing thread.
class scheduler {
public:
    virtual ~scheduler() = default;
    virtual void schedule(schedulable& item) = 0;

    static scheduler* current() noexcept;
};


// Installs a scheduler as the current one of the calling thread.
class [[nodiscard]] scheduler_scope {
public:
    explicit scheduler_scope(scheduler& sched) noexcept;
    scheduler_scope(const scheduler_scope&) = delete;
    scheduler_scope& operator=(const scheduler_scope&) = delete;
    ~scheduler_scope();

private:
    scheduler* m_previous = nullptr;
};

} // namespace taskstep
