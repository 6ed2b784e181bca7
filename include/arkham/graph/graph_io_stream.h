// graph/graph_io_stream.h - Stream-based diagnostic writer for graphs
// Part of the arkham board-structures library (C++20)
//
// Writes a graph in a line-oriented text form for logs and test output.
// Uses <ostream> - NOT <iostream> - to avoid pulling in static
// initialisation of std::cin/cout/cerr/clog.
//
// There is no reader: graphs are not persisted.

#ifndef ARKHAM_GRAPH_IO_STREAM_H
#define ARKHAM_GRAPH_IO_STREAM_H

#include "graph_concepts.h"

#include <ostream>

namespace arkham::graph::io {

/// Write a graph in the text form.
///
/// Output:
///   nodes N
///   node <value>        (one per node, insertion order)
///   edge <tail> <head>  (one per edge, insertion order)
///
/// Accepts digraph and partial_order alike.
template<graph_queryable G>
    requires streamable<typename G::node_type>
void write(std::ostream& os, G const& g) {
    os << "nodes " << g.node_count() << '\n';
    for (auto const& n : g.nodes()) {
        os << "node " << n << '\n';
    }
    for (auto const& e : g.edges()) {
        os << "edge " << e.tail << ' ' << e.head << '\n';
    }
}

} // namespace arkham::graph::io

#endif // ARKHAM_GRAPH_IO_STREAM_H
