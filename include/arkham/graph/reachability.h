// graph/reachability.h - Directed reachability search
// Part of the arkham board-structures library (C++20)
//
// ALGORITHM: Iterative depth-first search with three-colour marking.
// Complexity: O(V + E)
//
// DESIGN RATIONALE:
// Iterative (not recursive) so long chains of locations cannot exhaust
// the call stack.  An explicit stack of frames tracks which successor of
// each node is processed next, so the set of nodes on the current path
// (grey) is always known:
//
//   white - not yet discovered
//   grey  - on the current DFS path
//   black - fully explored
//
// Meeting a black node is normal (two paths to the same node, e.g. a
// diamond) and is skipped.  Meeting a grey node means a back edge, i.e.
// the graph already holds a cycle.  In reach_mode::assume_acyclic that is
// reported as invariant_violation; in reach_mode::general it is ignored.

#ifndef ARKHAM_GRAPH_REACHABILITY_H
#define ARKHAM_GRAPH_REACHABILITY_H

#include "digraph.h"
#include "graph_errors.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace arkham::graph {

/// How reaches() treats a back edge discovered during the search.
enum class reach_mode : std::uint8_t {
    general,         // cycles are legal; back edges are skipped
    assume_acyclic   // caller guarantees a DAG; a back edge throws
};

/// True if `to` is reachable from `from` via zero or more edges.
///
/// `from == to` is reachable (the empty path) whenever `from` is given,
/// even if it is not yet a node of g.  Otherwise unknown nodes reach
/// nothing.
///
/// Throws invariant_violation in reach_mode::assume_acyclic if the search
/// finds a node already on its current path.
///
/// Example:
/// ```cpp
/// digraph<char> g;
/// g.add_edge('a', 'b');
/// g.add_edge('b', 'c');
/// reaches(g, 'a', 'c');   // true
/// reaches(g, 'c', 'a');   // false
/// ```
template<typename Node, typename Hash>
[[nodiscard]] bool
reaches(digraph<Node, Hash> const& g, Node const& from, Node const& to,
        reach_mode mode = reach_mode::general)
{
    if (from == to) {
        return true;
    }

    auto const start = g.index_of(from);
    auto const target = g.index_of(to);
    if (!start || !target) {
        return false;
    }

    enum class colour : std::uint8_t { white, grey, black };
    std::vector<colour> state(g.node_count(), colour::white);

    struct frame {
        std::size_t node;
        std::size_t next;   // which successor we're processing next
    };
    std::vector<frame> stack;

    state[*start] = colour::grey;
    stack.push_back(frame{*start, 0});

    while (!stack.empty()) {
        auto& top = stack.back();
        auto const& succ = g.out_indices(top.node);

        if (top.next == succ.size()) {
            state[top.node] = colour::black;
            stack.pop_back();
            continue;
        }

        auto const w = succ[top.next++];
        if (w == *target) {
            return true;
        }

        switch (state[w]) {
        case colour::white:
            state[w] = colour::grey;
            stack.push_back(frame{w, 0});
            break;
        case colour::grey:
            if (mode == reach_mode::assume_acyclic) {
                throw invariant_violation(
                    "reaches: graph declared acyclic already contains a cycle");
            }
            break;
        case colour::black:
            break;
        }
    }

    return false;
}

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_REACHABILITY_H
