// graph/digraph.h - Mutable directed graph over hashable node values
// Part of the arkham board-structures library (C++20)
//
// DESIGN RATIONALE:
// Boards are assembled incrementally during setup (add a location, connect
// two locations) and then only queried.  digraph therefore supports
// insertion only; there is no removal, so the node and edge sets grow
// monotonically.
//
// STORAGE:
// Each distinct node is assigned a dense index on first sight.  Adjacency
// is kept per index (insertion order), which lets algorithms work on
// std::vector<bool>/std::vector<std::size_t> scratch arrays instead of
// hashing on every step.  Edges are kept twice: an insertion-ordered list
// for deterministic traversal and an unordered_set for O(1) duplicate
// detection.
//
// No error conditions: any edge between any two values is accepted,
// including self-loops.  Acyclicity is opt-in via partial_order.

#ifndef ARKHAM_GRAPH_DIGRAPH_H
#define ARKHAM_GRAPH_DIGRAPH_H

#include "graph_concepts.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arkham::graph {

/// Directed graph over value nodes.
///
/// Template parameters:
/// - Node: vertex value type; must satisfy hashable_node<Node, Hash>
/// - Hash: hasher for Node (default std::hash<Node>)
///
/// Example:
/// ```cpp
/// digraph<std::string> g;
/// g.add_node("Arkham Asylum");
/// g.add_edge("Independence Square", "Arkham Asylum");
/// // g.node_count() == 2, g.edge_count() == 1
/// ```
template<typename Node, typename Hash = std::hash<Node>>
    requires hashable_node<Node, Hash>
class digraph {
public:
    using node_type = Node;
    using hasher = Hash;
    using edge_type = edge<Node>;
    using edge_hasher = edge_hash<Node, Hash>;

    digraph() = default;

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert n if absent.  Idempotent.
    void add_node(Node const& n) { (void)intern(n); }

    /// Insert the edge (tail, head) and both endpoints.  Idempotent on
    /// duplicate edges.  Self-loops are accepted.
    void add_edge(Node const& tail, Node const& head) {
        edge_type e{tail, head};
        if (edge_set_.contains(e)) {
            return;
        }
        auto const t = intern(tail);
        auto const h = intern(head);
        edge_set_.insert(e);
        edges_.push_back(std::move(e));
        out_[t].push_back(h);
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    // =========================================================================
    // Read-only views
    // =========================================================================

    /// All nodes, each exactly once, in insertion order.
    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return nodes_; }

    /// All edges, each exactly once, in insertion order.
    [[nodiscard]] std::vector<edge_type> const& edges() const noexcept { return edges_; }

    [[nodiscard]] bool contains(Node const& n) const {
        return index_.contains(n);
    }

    [[nodiscard]] bool has_edge(Node const& tail, Node const& head) const {
        return edge_set_.contains(edge_type{tail, head});
    }

    /// Heads of all edges leaving n, in insertion order.
    /// Empty for nodes not in the graph.
    [[nodiscard]] std::vector<Node> out_neighbors(Node const& n) const {
        std::vector<Node> result;
        auto const idx = index_of(n);
        if (!idx) {
            return result;
        }
        result.reserve(out_[*idx].size());
        for (auto v : out_[*idx]) {
            result.push_back(nodes_[v]);
        }
        return result;
    }

    [[nodiscard]] std::size_t out_degree(Node const& n) const {
        auto const idx = index_of(n);
        return idx ? out_[*idx].size() : 0;
    }

    // =========================================================================
    // Index-level access (for algorithms)
    // =========================================================================
    //
    // Dense indices are stable for the lifetime of the graph: a node keeps
    // the index it received on first insertion.

    /// Dense index of n, or std::nullopt if n is not in the graph.
    [[nodiscard]] std::optional<std::size_t> index_of(Node const& n) const {
        auto const it = index_.find(n);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Node stored at dense index i.  Precondition: i < node_count().
    [[nodiscard]] Node const& node_at(std::size_t i) const { return nodes_[i]; }

    /// Successor indices of dense index i.  Precondition: i < node_count().
    [[nodiscard]] std::vector<std::size_t> const&
    out_indices(std::size_t i) const { return out_[i]; }

private:
    // index_ is written last so it never names a slot that does not exist.
    std::size_t intern(Node const& n) {
        if (auto const it = index_.find(n); it != index_.end()) {
            return it->second;
        }
        std::size_t const i = nodes_.size();
        nodes_.push_back(n);
        try {
            out_.emplace_back();
            index_.emplace(n, i);
        } catch (...) {
            out_.resize(i);
            nodes_.pop_back();
            throw;
        }
        return i;
    }

    std::vector<Node> nodes_;
    std::unordered_map<Node, std::size_t, Hash> index_;
    std::vector<std::vector<std::size_t>> out_;
    std::vector<edge_type> edges_;
    std::unordered_set<edge_type, edge_hasher> edge_set_;
};

// Verify concept satisfaction.
static_assert(graph_queryable<digraph<int>>);

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_DIGRAPH_H
