// graph/partial_order.h - Directed acyclic graph with cycle-rejecting insertion
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// partial_order holds a digraph by composition rather than deriving from
// it.  Every mutation goes through partial_order::add_edge, which runs
// the cycle check before delegating the insertion, so there is no base
// class method that could bypass the check.
//
// CYCLE CHECK:
// Adding (tail, head) closes a cycle iff tail is reachable from head via
// zero or more existing edges.  The zero-edge case is the self-loop
// tail == head.  The search is reaches(..., reach_mode::assume_acyclic):
// finding a node already on the search path means the stored graph is
// already cyclic, which add_edge makes impossible, and is reported as
// invariant_violation rather than cycle_error.
//
// Check and insert are all-or-nothing: on cycle_error nothing changes.
// Cost is O(V + E) per insertion; nothing is memoised across calls.

#ifndef ARKHAM_GRAPH_PARTIAL_ORDER_H
#define ARKHAM_GRAPH_PARTIAL_ORDER_H

#include "digraph.h"
#include "graph_concepts.h"
#include "graph_errors.h"
#include "reachability.h"
#include "topological_sort.h"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace arkham::graph {

/// Directed acyclic graph over value nodes.
///
/// The reachability relation of the edges is the (strict) order:
/// precedes(a, b) iff there is a non-empty path a -> ... -> b.
///
/// Example:
/// ```cpp
/// partial_order<char> po;
/// po.add_edge('a', 'b');
/// po.add_edge('b', 'c');
/// po.add_edge('a', 'c');   // fine, no cycle
/// po.add_edge('c', 'a');   // throws cycle_error
/// ```
template<typename Node, typename Hash = std::hash<Node>>
    requires hashable_node<Node, Hash>
class partial_order {
public:
    using node_type = Node;
    using hasher = Hash;
    using graph_type = digraph<Node, Hash>;
    using edge_type = typename graph_type::edge_type;

    partial_order() = default;

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert n if absent.  Isolated nodes never affect acyclicity.
    void add_node(Node const& n) { graph_.add_node(n); }

    /// Insert (tail, head) unless it would close a cycle.
    ///
    /// Throws cycle_error (graph unchanged) if tail is reachable from head,
    /// including tail == head.  Throws invariant_violation if the stored
    /// graph is found to be cyclic already.
    void add_edge(Node const& tail, Node const& head) {
        if (would_create_cycle(tail, head)) {
            throw cycle_error(
                "partial_order::add_edge: edge closes a cycle");
        }
        graph_.add_edge(tail, head);
    }

    // =========================================================================
    // Order queries
    // =========================================================================

    /// True if add_edge(tail, head) would be rejected.  Never mutates.
    [[nodiscard]] bool would_create_cycle(Node const& tail, Node const& head) const {
        return reaches(graph_, head, tail, reach_mode::assume_acyclic);
    }

    /// Strict order: b is reachable from a via one or more edges.
    /// Irreflexive since the graph is acyclic.
    [[nodiscard]] bool precedes(Node const& a, Node const& b) const {
        if (a == b) {
            return false;
        }
        return reaches(graph_, a, b, reach_mode::assume_acyclic);
    }

    /// All nodes in an order consistent with every edge.
    [[nodiscard]] std::vector<Node> linear_extension() const {
        auto r = topological_sort(graph_);
        if (!r.is_dag) {
            throw invariant_violation(
                "partial_order::linear_extension: stored graph is cyclic");
        }
        return std::move(r.order);
    }

    // =========================================================================
    // Read-only views (delegated)
    // =========================================================================

    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return graph_.nodes(); }
    [[nodiscard]] std::vector<edge_type> const& edges() const noexcept { return graph_.edges(); }

    [[nodiscard]] std::size_t node_count() const noexcept { return graph_.node_count(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return graph_.edge_count(); }
    [[nodiscard]] bool empty() const noexcept { return graph_.empty(); }

    [[nodiscard]] bool contains(Node const& n) const { return graph_.contains(n); }
    [[nodiscard]] bool has_edge(Node const& tail, Node const& head) const {
        return graph_.has_edge(tail, head);
    }
    [[nodiscard]] std::vector<Node> out_neighbors(Node const& n) const {
        return graph_.out_neighbors(n);
    }

    /// The underlying digraph, for algorithms that take one.
    [[nodiscard]] graph_type const& graph() const noexcept { return graph_; }

private:
    graph_type graph_;
};

// Verify concept satisfaction.
static_assert(graph_queryable<partial_order<int>>);

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_PARTIAL_ORDER_H
