// examples/example_monster_deck.cpp - Deque-backed decks
//
// Builds a monster deck, shuffles it with a fixed seed, draws from both
// ends, and turns deck exhaustion into a game event.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_monster_deck examples/example_monster_deck.cpp

#include <arkham/core/deck.h>
#include <arkham/core/deque.h>
#include <arkham/core/deque_io.h>
#include <arkham/core/errors.h>

#include <iostream>
#include <ostream>
#include <string>

using namespace arkham;

struct monster {
    std::string name;
    int toughness = 1;

    friend std::ostream& operator<<(std::ostream& os, monster const& m) {
        return os << m.name << '(' << m.toughness << ')';
    }
};

int main() {
    std::cout << "=== Monster Deck ===\n\n";

    deque_deck<monster> monsters({{"Ghoul", 1},
                                  {"Cultist", 1},
                                  {"Byakhee", 2},
                                  {"Dark Young", 3},
                                  {"Star Spawn", 3}},
                                 /*seed=*/1926u);

    std::cout << "Before shuffle: " << monsters.cards() << '\n';
    monsters.shuffle();
    std::cout << "After shuffle:  " << monsters.cards() << '\n';

    std::cout << "Drawn from front: " << monsters.draw_front() << '\n';
    std::cout << "Drawn from rear:  " << monsters.draw_rear() << '\n';

    monsters.add_card_rear({"Nightgaunt", 2});
    std::cout << "Returned Nightgaunt to the bottom: " << monsters.cards() << '\n';

    // Draw until the deck runs out; exhaustion is a game event.
    deck<monster>& pile = monsters;
    while (true) {
        try {
            auto const m = pile.draw_front();
            std::cout << "  draw " << m << '\n';
        } catch (deck_exhausted const&) {
            std::cout << "Monster deck exhausted: the gates begin to open.\n";
            break;
        }
    }

    std::cout << "\n=== Token Deque ===\n\n";
    deque<int, growth::compact> tokens{1, 2, 3};
    tokens.enqueue_front(0);
    tokens.enqueue_rear(4);
    std::cout << "tokens = " << tokens << ", size " << tokens.size() << '\n';
    return 0;
}
