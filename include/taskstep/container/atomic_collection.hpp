#pragma once

#include <atomic>
#include <cstddef>
#include <limits>


namespace taskstep {

// Lock-free intrusive stack that can be closed once. Pushing to a closed
// collection fails and returns the closed marker.
template <class Element, Element* Element::*next>
class atomic_collection {
public:
    atomic_collection() noexcept = default;

    Element* push(Element* element) noexcept {
        Element* first = m_first.load(std::memory_order_acquire);
        do {
            if (closed(first)) {
                break;
            }
            element->*next = first;
        } while (!m_first.compare_exchange_weak(first, element, std::memory_order_release, std::memory_order_acquire));
        return first;
    }

    Element* detach() noexcept {
        return m_first.exchange(nullptr, std::memory_order_acquire);
    }

    Element* close() noexcept {
        return m_first.exchange(CLOSED, std::memory_order_acq_rel);
    }

    bool empty() const noexcept {
        const auto item = m_first.load(std::memory_order_relaxed);
        return item == nullptr || closed(item);
    }

    bool closed() const noexcept {
        return closed(m_first.load(std::memory_order_acquire));
    }

    static bool closed(Element* element) noexcept {
        return element == CLOSED;
    }

    Element* first() const noexcept {
        return m_first.load(std::memory_order_relaxed);
    }

private:
    std::atomic<Element*> m_first = nullptr;
    static inline Element* const CLOSED = reinterpret_cast<Element*>(std::numeric_limits<size_t>::max());
};

} // namespace taskstep
