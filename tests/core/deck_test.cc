// tests/core/deck_test.cc
//
// Google Tests for the deck interface and deque_deck.

#include <arkham/core/deck.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <exception>
#include <initializer_list>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace arkham;

namespace {

struct monster {
    std::string name;
    int toughness = 1;
    friend bool operator==(monster const&, monster const&) = default;
};

template<typename D>
std::vector<typename D::card_type> cards_of(D const& d) {
    return {d.cards().begin(), d.cards().end()};
}

std::vector<int> sorted(std::vector<int> v) {
    std::sort(v.begin(), v.end());
    return v;
}

} // namespace

// ============================================================================
// Drawing and adding
// ============================================================================

TEST(DequeDeck, StartsEmpty) {
    deque_deck<int> d;
    EXPECT_TRUE(d.empty());
    EXPECT_EQ(d.size(), 0u);
}

TEST(DequeDeck, InitialCardsFrontToRear) {
    deque_deck<std::string> d({"ghoul", "cultist", "byakhee"});
    EXPECT_EQ(d.size(), 3u);
    EXPECT_EQ(d.draw_front(), "ghoul");
    EXPECT_EQ(d.draw_rear(), "byakhee");
    EXPECT_EQ(d.draw_front(), "cultist");
    EXPECT_TRUE(d.empty());
}

TEST(DequeDeck, AddCards) {
    deque_deck<int> d;
    d.add_card_rear(2);
    d.add_card_front(1);
    d.add_card_rear(3);
    EXPECT_EQ(cards_of(d), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(d.draw_rear(), 3);
    EXPECT_EQ(d.size(), 2u);
}

TEST(DequeDeck, MovedFromIsEmptyAndReusable) {
    deque_deck<int> a({1, 2, 3}, 7);
    auto b = std::move(a);
    EXPECT_EQ(cards_of(b), (std::vector<int>{1, 2, 3}));

    EXPECT_TRUE(a.empty());
    EXPECT_EQ(a.size(), 0u);
    EXPECT_THROW((void)a.draw_front(), deck_exhausted);

    a.add_card_rear(9);
    EXPECT_EQ(a.draw_front(), 9);
}

TEST(DequeDeck, MoveAssignmentEmptiesSource) {
    deque_deck<monster> a({{"ghoul", 2}, {"cultist", 1}}, 3);
    deque_deck<monster> b({{"byakhee", 3}}, 3);
    b = std::move(a);

    EXPECT_EQ(b.size(), 2u);
    EXPECT_EQ(b.draw_front().name, "ghoul");
    EXPECT_TRUE(a.empty());
    EXPECT_THROW((void)a.draw_rear(), deck_exhausted);
}

TEST(DequeDeck, ExhaustedDeckThrows) {
    deque_deck<int> d;
    EXPECT_THROW((void)d.draw_front(), deck_exhausted);
    EXPECT_THROW((void)d.draw_rear(), deck_exhausted);

    d.add_card_rear(1);
    (void)d.draw_front();
    EXPECT_THROW((void)d.draw_front(), deck_exhausted);
    EXPECT_THROW((void)d.draw_rear(), std::out_of_range);
}

TEST(DequeDeck, ExhaustionIsNotReportedAsDequeError) {
    deque_deck<int> d;
    try {
        (void)d.draw_front();
        FAIL() << "draw_front on an empty deck returned a card";
    } catch (std::exception const& e) {
        EXPECT_EQ(dynamic_cast<empty_deque_error const*>(&e), nullptr);
        EXPECT_NE(dynamic_cast<deck_exhausted const*>(&e), nullptr);
    }
}

// ============================================================================
// Shuffle
// ============================================================================

TEST(DequeDeck, ShufflePreservesMultiset) {
    std::vector<int> cards{1, 1, 2, 3, 5, 8, 13, 21, 34, 55, 55, 89};
    deque_deck<int> d(cards.begin(), cards.end(), 7u);

    for (int i = 0; i < 10; ++i) {
        d.shuffle();
        EXPECT_EQ(d.size(), cards.size());
        EXPECT_EQ(sorted(cards_of(d)), sorted(cards));
    }
}

TEST(DequeDeck, ShuffleReordersLargeDeck) {
    std::vector<int> cards(52);
    for (int i = 0; i < 52; ++i) cards[i] = i;
    deque_deck<int> d(cards.begin(), cards.end(), 12345u);

    d.shuffle();
    // 1/52! chance of identity; the fixed seed makes this deterministic.
    EXPECT_NE(cards_of(d), cards);
}

TEST(DequeDeck, SameSeedSameShuffle) {
    deque_deck<int> a({1, 2, 3, 4, 5, 6, 7, 8}, 99u);
    deque_deck<int> b({1, 2, 3, 4, 5, 6, 7, 8}, 99u);
    a.shuffle();
    b.shuffle();
    EXPECT_EQ(cards_of(a), cards_of(b));
}

TEST(DequeDeck, ShuffleEmptyAndSingleton) {
    deque_deck<int> empty;
    EXPECT_NO_THROW(empty.shuffle());
    EXPECT_TRUE(empty.empty());

    deque_deck<int> one({42}, 1u);
    one.shuffle();
    EXPECT_EQ(one.draw_front(), 42);
}

TEST(DequeDeck, ShuffleMatchesStdShuffle) {
    std::vector<int> cards{10, 20, 30, 40, 50};
    deque_deck<int, std::mt19937> d(cards.begin(), cards.end(), 5u);
    d.shuffle();

    std::mt19937 engine(5u);
    auto expected = cards;
    std::shuffle(expected.begin(), expected.end(), engine);
    EXPECT_EQ(cards_of(d), expected);
}

// ============================================================================
// Through the interface
// ============================================================================

TEST(Deck, UsableThroughInterface) {
    std::unique_ptr<deck<monster>> d =
        std::make_unique<deque_deck<monster>>(
            std::initializer_list<monster>{{"Ghoul", 1}, {"Dark Young", 3}});

    EXPECT_EQ(d->size(), 2u);
    d->add_card_front(monster{"Cultist", 1});
    d->shuffle();
    EXPECT_EQ(d->size(), 3u);

    std::vector<std::string> names;
    while (!d->empty()) {
        names.push_back(d->draw_front().name);
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"Cultist", "Dark Young", "Ghoul"}));
    EXPECT_THROW((void)d->draw_rear(), deck_exhausted);
}
