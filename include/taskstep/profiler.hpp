#pragma once

#if defined(TASKSTEP_USE_TRACY) && TASKSTEP_USE_TRACY
    #include <sstream>
    #include <string>
    #include <utility>
    #include <tracy/Tracy.hpp>

namespace taskstep::impl_profiler {

template <class... Args>
std::string format_notes(Args&&... args) {
    std::ostringstream os;
    ((os << std::forward<Args>(args) << " | "), ...);
    return os.str();
}

} // namespace taskstep::impl_profiler

    #define TASKSTEP_PROFILE_SCOPE() ZoneScoped
    #define TASKSTEP_ATTACH_NOTE(...)                                               \
        {                                                                           \
            const std::string note = ::taskstep::impl_profiler::format_notes(__VA_ARGS__); \
            ZoneText(note.c_str(), note.size());                                    \
        }                                                                           \
        void()
#else
    #define TASKSTEP_PROFILE_SCOPE()
    #define TASKSTEP_ATTACH_NOTE(...) void()
#endif
