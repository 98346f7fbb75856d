#pragma once

#include "concepts.hpp"

#include <cassert>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>


namespace taskstep {

// Single forward pass over a standard range. Lvalue ranges are referenced,
// rvalue ranges are owned by the enumerator.
template <class Range>
class range_enumerator {
    using iterator = std::ranges::iterator_t<std::remove_reference_t<Range>>;

public:
    explicit range_enumerator(Range&& range) : m_range(std::forward<Range>(range)) {}

    bool move_next() {
        if (m_finished) {
            return false;
        }
        if (!m_current) {
            m_current = std::ranges::begin(m_range);
        }
        else {
            ++*m_current;
        }
        m_finished = *m_current == std::ranges::end(m_range);
        return !m_finished;
    }

    decltype(auto) current() {
        assert(m_current && !m_finished);
        return **m_current;
    }

    void dispose() noexcept {
        m_current.reset();
        m_finished = true;
    }

private:
    Range m_range;
    std::optional<iterator> m_current;
    bool m_finished = false;
};


template <class Sequence>
auto make_enumerator(Sequence&& sequence) {
    if constexpr (enumerable<Sequence>) {
        return sequence.get_enumerator();
    }
    else {
        static_assert(std::ranges::input_range<Sequence>, "sequence must be enumerable or an input range");
        return range_enumerator<Sequence>(std::forward<Sequence>(sequence));
    }
}

} // namespace taskstep
