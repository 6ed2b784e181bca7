// graph/graph_concepts.h - Node constraints, edge type and graph concepts
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// Nodes are plain values (locations, tokens, names).  The graph stores
// them by value and never owns anything they refer to.  The only
// requirements are equality and a stable hash, expressed as the
// hashable_node concept so a bad node type fails at instantiation
// instead of deep inside an unordered container.
//
// Edges are ordered (tail, head) pairs.  edge<Node> is a small aggregate
// with a matching hash functor so edge sets can use the node's hasher.

#ifndef ARKHAM_GRAPH_CONCEPTS_H
#define ARKHAM_GRAPH_CONCEPTS_H

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>

namespace arkham::graph {

// =============================================================================
// Node constraints
// =============================================================================

/// A node value usable as a graph vertex under hasher Hash.
///
/// Requirements:
/// - equality comparable (set membership)
/// - copy constructible (nodes are stored by value)
/// - Hash{}(n) yields something convertible to std::size_t
template<typename Node, typename Hash = std::hash<Node>>
concept hashable_node =
    std::equality_comparable<Node> &&
    std::copy_constructible<Node> &&
    std::default_initializable<Hash> &&
    requires(Hash const& h, Node const& n) {
        { h(n) } -> std::convertible_to<std::size_t>;
    };

/// A value that can be written to a std::ostream.  Required only by the
/// diagnostic writers in graph_io_stream.h / graph_io_dot.h.
template<typename T>
concept streamable = requires(std::ostream& os, T const& v) {
    { os << v } -> std::convertible_to<std::ostream&>;
};

// =============================================================================
// Edge type
// =============================================================================

/// Directed edge from tail to head.
template<typename Node>
struct edge {
    Node tail;
    Node head;

    friend bool operator==(edge const&, edge const&) = default;
};

/// Hash for edge<Node>, combining the endpoint hashes.
/// Order-sensitive: (a, b) and (b, a) hash differently.
template<typename Node, typename Hash = std::hash<Node>>
struct edge_hash {
    [[nodiscard]] std::size_t operator()(edge<Node> const& e) const {
        Hash h;
        std::size_t seed = static_cast<std::size_t>(h(e.tail));
        seed ^= static_cast<std::size_t>(h(e.head)) + std::size_t{0x9e3779b9} +
                (seed << 6) + (seed >> 2);
        return seed;
    }
};

// =============================================================================
// Graph concept
// =============================================================================

/// A graph_queryable exposes read-only adjacency over value nodes.
///
/// Satisfied by:
/// - digraph<Node, Hash>
/// - partial_order<Node, Hash>
///
/// Algorithms (reaches, topological_sort, the writers) accept any
/// graph_queryable so the partial order can be passed directly.
template<typename G>
concept graph_queryable =
    requires(G const& g, typename G::node_type const& n) {
        typename G::node_type;
        { g.node_count() } -> std::convertible_to<std::size_t>;
        { g.edge_count() } -> std::convertible_to<std::size_t>;
        { g.contains(n) } -> std::convertible_to<bool>;
        { g.nodes() };
        { g.edges() };
        { g.out_neighbors(n) };
    };

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_CONCEPTS_H
