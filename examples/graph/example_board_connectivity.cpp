// examples/graph/example_board_connectivity.cpp - Board connectivity and phase ordering
//
// A location manager registers board spaces and connects them with a
// digraph.  Movement queries read the out-neighbours.  Turn phases are a
// partial_order: a phase may only be scheduled after everything it
// depends on, and a dependency that loops back is rejected.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_board_connectivity examples/graph/example_board_connectivity.cpp

#include <arkham/graph/digraph.h>
#include <arkham/graph/graph_errors.h>
#include <arkham/graph/graph_io_dot.h>
#include <arkham/graph/partial_order.h>
#include <arkham/graph/reachability.h>

#include <cstddef>
#include <functional>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

using namespace arkham::graph;

// =========================================================================
// Board spaces
// =========================================================================

struct space {
    std::string name;
    double x = 0.0;
    double y = 0.0;

    friend bool operator==(space const& a, space const& b) { return a.name == b.name; }
    friend std::ostream& operator<<(std::ostream& os, space const& s) { return os << s.name; }
};

struct space_hash {
    std::size_t operator()(space const& s) const {
        return std::hash<std::string>{}(s.name);
    }
};

/// Registers spaces by name and connects them.
class space_manager {
public:
    void add_space(space s) {
        graph_.add_node(s);
        auto key = s.name;
        spaces_.insert_or_assign(std::move(key), std::move(s));
    }

    /// Throws std::out_of_range for unknown names.
    void connect(std::string const& from, std::string const& to) {
        graph_.add_edge(spaces_.at(from), spaces_.at(to));
    }

    [[nodiscard]] space const& get(std::string const& name) const {
        return spaces_.at(name);
    }

    [[nodiscard]] digraph<space, space_hash> const& graph() const noexcept { return graph_; }

private:
    digraph<space, space_hash> graph_;
    std::unordered_map<std::string, space> spaces_;
};

int main() {
    std::cout << "=== Board Connectivity ===\n\n";

    space_manager board;
    board.add_space({"Train Station", 0.0, 0.0});
    board.add_space({"Independence Square", 1.0, 0.0});
    board.add_space({"Arkham Asylum", 2.0, 1.0});
    board.add_space({"Miskatonic University", 1.0, 2.0});
    board.add_space({"The Witch House", 3.0, 3.0});

    board.connect("Train Station", "Independence Square");
    board.connect("Independence Square", "Train Station");
    board.connect("Independence Square", "Arkham Asylum");
    board.connect("Independence Square", "Miskatonic University");
    board.connect("Miskatonic University", "Arkham Asylum");

    auto const& g = board.graph();
    std::cout << g.node_count() << " spaces, " << g.edge_count() << " connections\n";
    for (auto const& s : g.nodes()) {
        std::cout << "  " << s.name << " ->";
        for (auto const& n : g.out_neighbors(s)) std::cout << " [" << n.name << "]";
        std::cout << '\n';
    }

    auto const& station = board.get("Train Station");
    auto const& witch = board.get("The Witch House");
    std::cout << "\nTrain Station reaches Arkham Asylum: "
              << (reaches(g, station, board.get("Arkham Asylum")) ? "yes" : "no") << '\n';
    std::cout << "Train Station reaches The Witch House: "
              << (reaches(g, station, witch) ? "yes" : "no") << '\n';

    try {
        board.connect("Train Station", "R'lyeh");
    } catch (std::out_of_range const&) {
        std::cout << "Unknown space R'lyeh rejected\n";
    }

    std::cout << "\nDOT:\n";
    io::write_dot(std::cout, g, "arkham");

    // =====================================================================
    // Turn phases as a partial order
    // =====================================================================

    std::cout << "\n=== Turn Phases ===\n\n";
    partial_order<std::string> phases;
    phases.add_edge("upkeep", "movement");
    phases.add_edge("movement", "encounters");
    phases.add_edge("encounters", "mythos");
    phases.add_edge("upkeep", "mythos");

    try {
        phases.add_edge("mythos", "upkeep");
    } catch (cycle_error const& e) {
        std::cout << "Rejected mythos -> upkeep: " << e.what() << '\n';
    }

    std::cout << "Phase order:";
    for (auto const& p : phases.linear_extension()) std::cout << ' ' << p;
    std::cout << '\n';
    return 0;
}
