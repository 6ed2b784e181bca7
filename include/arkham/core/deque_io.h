// core/deque_io.h - Stream-based diagnostic writer for deque
// Part of the arkham board-structures library (C++20)
//
// Output form, front to rear:  [a, b, c]   (empty: [])
// Uses <ostream> only.

#ifndef ARKHAM_CORE_DEQUE_IO_H
#define ARKHAM_CORE_DEQUE_IO_H

#include "deque.h"

#include <ostream>

namespace arkham {

namespace io {

template<typename T, growth_policy Growth>
    requires requires(std::ostream& os, T const& v) { os << v; }
void write(std::ostream& os, deque<T, Growth> const& d) {
    os << '[';
    bool first = true;
    for (auto const& item : d) {
        if (!first) os << ", ";
        os << item;
        first = false;
    }
    os << ']';
}

} // namespace io

template<typename T, growth_policy Growth>
    requires requires(std::ostream& os, T const& v) { os << v; }
std::ostream& operator<<(std::ostream& os, deque<T, Growth> const& d) {
    io::write(os, d);
    return os;
}

} // namespace arkham

#endif // ARKHAM_CORE_DEQUE_IO_H
