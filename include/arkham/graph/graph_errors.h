// graph/graph_errors.h - Exception types raised by graph structures
// Part of the arkham board-structures library (C++20)
//
// digraph raises nothing: every add_node/add_edge is total.
// All structural failures come from partial_order and the reachability
// search it relies on:
//
//   cycle_error          - the proposed edge would close a directed cycle.
//                          Recoverable; the graph is unchanged.
//   invariant_violation  - the search met a node already on its own DFS
//                          path, i.e. the stored graph is already cyclic.
//                          Indicates corrupted structure; not expected to
//                          be caught and continued.

#ifndef ARKHAM_GRAPH_ERRORS_H
#define ARKHAM_GRAPH_ERRORS_H

#include <stdexcept>

namespace arkham::graph {

/// Thrown by partial_order::add_edge when (tail, head) would close a cycle.
class cycle_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Thrown when a search over a graph that must be acyclic finds a cycle
/// that is already present.
class invariant_violation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_ERRORS_H
