// core/deck.h - Deck interface and its deque-backed implementation
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// Game code handles many kinds of decks (monsters, encounters, events)
// through one interface: draw or add at either end, shuffle, count.
// deck<Card> is that interface.  deque_deck<Card> implements it by
// exclusively owning one deque<Card> and one random engine; nothing else
// holds a reference to either.
//
// SHUFFLE:
// Copy the contents front-to-rear into a std::vector, std::shuffle it
// with the owned engine (uniform permutation), rebuild the deque from the
// permuted sequence.  The multiset of cards is unchanged.
//
// EXHAUSTION:
// deque reports emptiness as empty_deque_error.  deque_deck translates
// it into deck_exhausted, which is what game code catches.

#ifndef ARKHAM_CORE_DECK_H
#define ARKHAM_CORE_DECK_H

#include "deque.h"
#include "errors.h"
#include "growth_policy.h"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <random>
#include <utility>
#include <vector>

namespace arkham {

// =============================================================================
// deck<Card> - interface
// =============================================================================

/// Abstract deck of cards of type Card.
template<typename Card>
class deck {
public:
    using card_type = Card;

    virtual ~deck() = default;

    virtual void shuffle() = 0;

    /// Throws deck_exhausted when the deck is empty.
    [[nodiscard]] virtual Card draw_front() = 0;
    /// Throws deck_exhausted when the deck is empty.
    [[nodiscard]] virtual Card draw_rear() = 0;

    virtual void add_card_front(Card card) = 0;
    virtual void add_card_rear(Card card) = 0;

    [[nodiscard]] virtual std::size_t size() const = 0;
    [[nodiscard]] bool empty() const { return size() == 0; }

protected:
    deck() = default;
    deck(deck const&) = default;
    deck(deck&&) = default;
    deck& operator=(deck const&) = default;
    deck& operator=(deck&&) = default;
};

// =============================================================================
// deque_deck<Card, URBG> - deque-backed implementation
// =============================================================================

/// Deck backed by a single owned deque<Card>.
///
/// Template parameters:
/// - Card: card type (copyable, so shuffle can take a working copy)
/// - URBG: uniform random bit generator used by shuffle
/// - Growth: growth policy of the owned deque
///
/// Example:
/// ```cpp
/// deque_deck<monster> monsters({ghoul, cultist, byakhee}, /*seed=*/42);
/// monsters.shuffle();
/// auto m = monsters.draw_front();
/// ```
template<typename Card,
         std::uniform_random_bit_generator URBG = std::mt19937_64,
         growth_policy Growth = growth::standard>
    requires std::copy_constructible<Card>
class deque_deck : public deck<Card> {
public:
    using engine_type = URBG;
    using storage_type = deque<Card, Growth>;
    using seed_type = typename URBG::result_type;

    /// Empty deck, engine seeded with URBG's default seed.
    deque_deck() = default;

    /// Empty deck, engine seeded with `seed` (reproducible shuffles).
    explicit deque_deck(seed_type seed) : engine_(seed) {}

    /// Deck holding `cards` in order (first card on the front).
    deque_deck(std::initializer_list<Card> cards)
        : cards_(cards.begin(), cards.end()) {}

    deque_deck(std::initializer_list<Card> cards, seed_type seed)
        : cards_(cards.begin(), cards.end()), engine_(seed) {}

    template<std::input_iterator It, std::sentinel_for<It> S>
    deque_deck(It first, S last, seed_type seed)
        : cards_(first, last), engine_(seed) {}

    void shuffle() override {
        std::vector<Card> working(cards_.begin(), cards_.end());
        std::shuffle(working.begin(), working.end(), engine_);
        cards_ = storage_type(working.begin(), working.end());
    }

    [[nodiscard]] Card draw_front() override {
        try {
            return cards_.dequeue_front();
        } catch (empty_deque_error const&) {
            throw deck_exhausted("deck::draw_front: deck is empty");
        }
    }

    [[nodiscard]] Card draw_rear() override {
        try {
            return cards_.dequeue_rear();
        } catch (empty_deque_error const&) {
            throw deck_exhausted("deck::draw_rear: deck is empty");
        }
    }

    void add_card_front(Card card) override { cards_.enqueue_front(std::move(card)); }
    void add_card_rear(Card card) override { cards_.enqueue_rear(std::move(card)); }

    [[nodiscard]] std::size_t size() const override { return cards_.size(); }

    /// Read-only view of the cards, front to rear.
    [[nodiscard]] storage_type const& cards() const noexcept { return cards_; }

private:
    storage_type cards_;
    URBG engine_;
};

} // namespace arkham

#endif // ARKHAM_CORE_DECK_H
