// graph/topological_sort.h - Topological ordering of a digraph
// Part of the arkham board-structures library (C++20)
//
// ALGORITHM: Kahn's algorithm (BFS-based).
// Complexity: O(V + E)
// Determinism: when multiple nodes have in-degree 0, the one inserted
// into the graph first is chosen.  The order depends only on the sequence
// of add_node/add_edge calls, never on hash values.
//
// DESIGN RATIONALE:
// Kahn's (not DFS-based) because:
// - Naturally produces the order in forward sequence
// - Detects cycles (if output size < V, graph has a cycle)
// - No recursion

#ifndef ARKHAM_GRAPH_TOPOLOGICAL_SORT_H
#define ARKHAM_GRAPH_TOPOLOGICAL_SORT_H

#include "digraph.h"

#include <cstddef>
#include <functional>
#include <queue>
#include <vector>

namespace arkham::graph {

/// Result of topological sort.
///
/// - order: nodes in topological order (tails before heads)
/// - is_dag: true if graph is a DAG; false if cycle detected
///   When is_dag is false, order contains only the nodes that could be
///   emitted before the cycle blocked progress.
template<typename Node>
struct topo_result {
    std::vector<Node> order{};
    bool is_dag = true;
};

/// Topological sort via Kahn's algorithm.
///
/// Example:
/// ```cpp
/// digraph<int> g;
/// g.add_edge(0, 1); g.add_edge(0, 2); g.add_edge(1, 3); g.add_edge(2, 3);
/// auto r = topological_sort(g);
/// // r.is_dag, r.order == {0, 1, 2, 3}
/// ```
template<typename Node, typename Hash>
[[nodiscard]] topo_result<Node>
topological_sort(digraph<Node, Hash> const& g)
{
    topo_result<Node> result;
    auto const V = g.node_count();
    if (V == 0) {
        return result;
    }
    result.order.reserve(V);

    // Step 1: Compute in-degrees.
    std::vector<std::size_t> in_degree(V, 0);
    for (std::size_t u = 0; u < V; ++u) {
        for (auto v : g.out_indices(u)) {
            ++in_degree[v];
        }
    }

    // Step 2: Seed with every node of in-degree 0.  A min-heap on the
    // dense index gives insertion-order tie-breaking.
    std::priority_queue<std::size_t, std::vector<std::size_t>,
                        std::greater<>> ready;
    for (std::size_t u = 0; u < V; ++u) {
        if (in_degree[u] == 0) {
            ready.push(u);
        }
    }

    // Step 3: Kahn's iteration.
    while (!ready.empty()) {
        auto const chosen = ready.top();
        ready.pop();
        result.order.push_back(g.node_at(chosen));

        for (auto v : g.out_indices(chosen)) {
            if (--in_degree[v] == 0) {
                ready.push(v);
            }
        }
    }

    // Nodes left over sit on or behind a cycle.
    result.is_dag = result.order.size() == V;
    return result;
}

} // namespace arkham::graph

#endif // ARKHAM_GRAPH_TOPOLOGICAL_SORT_H
