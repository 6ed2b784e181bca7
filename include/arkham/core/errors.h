// core/errors.h - Exception types raised by deque and deck
// Part of the arkham board-structures library (C++20)
//
//   empty_deque_error - dequeue or peek on an empty deque.  The deque is
//                       unchanged.
//   deck_exhausted    - draw from an empty deck.  Deck owners catch this
//                       and turn it into a game event; the raw deque
//                       error never leaves deque_deck.

#ifndef ARKHAM_CORE_ERRORS_H
#define ARKHAM_CORE_ERRORS_H

#include <stdexcept>

namespace arkham {

class empty_deque_error : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

class deck_exhausted : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

} // namespace arkham

#endif // ARKHAM_CORE_ERRORS_H
