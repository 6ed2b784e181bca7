// graph/graph_io_dot.h - Graphviz DOT export
// Part of the arkham board-structures library (C++20)
//
// Writes graphs in DOT format for visualisation with Graphviz.
// Node values are written through operator<< and quoted, so names with
// spaces ("Miskatonic University") survive.  No parsing, no <iostream>.

#ifndef ARKHAM_GRAPH_IO_DOT_H
#define ARKHAM_GRAPH_IO_DOT_H

#include "graph_concepts.h"

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace arkham::graph::io {

namespace detail {

/// Render v via operator<< and wrap it in double quotes, escaping
/// embedded quotes and backslashes.
template<streamable T>
std::string dot_quote(T const& v) {
    std::ostringstream raw;
    raw << v;
    auto const text = raw.str();
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace detail

/// Write a graph in Graphviz DOT format.
///
/// Nodes without outgoing or incoming edges are emitted standalone so
/// they appear in the drawing.
///
/// Example output:
/// ```dot
/// digraph G {
///   "a" -> "b";
///   "c";
/// }
/// ```
template<graph_queryable G>
    requires streamable<typename G::node_type>
void write_dot(std::ostream& os, G const& g,
               std::string_view graph_name = "G")
{
    os << "digraph " << graph_name << " {\n";

    // Nodes touched by at least one edge.
    std::unordered_set<typename G::node_type, typename G::hasher> linked;
    for (auto const& e : g.edges()) {
        linked.insert(e.tail);
        linked.insert(e.head);
    }

    for (auto const& n : g.nodes()) {
        if (!linked.contains(n)) {
            // Isolated node - emit standalone so it appears in the DOT output.
            os << "  " << detail::dot_quote(n) << ";\n";
        }
    }

    for (auto const& e : g.edges()) {
        os << "  " << detail::dot_quote(e.tail) << " -> "
           << detail::dot_quote(e.head) << ";\n";
    }

    os << "}\n";
}

} // namespace arkham::graph::io

#endif // ARKHAM_GRAPH_IO_DOT_H
