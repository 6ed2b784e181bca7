// graph/graph.h - Umbrella header for the arkham graph library
// Part of the arkham board-structures library (C++20)
//
// Single-include convenience header.  Pulls in all graph components:
// representation, algorithms, errors.
//
// Usage:
//   #include <arkham/graph/graph.h>

#ifndef ARKHAM_GRAPH_GRAPH_H
#define ARKHAM_GRAPH_GRAPH_H

// --- Core types & concepts ---
#include "graph_concepts.h"
#include "graph_errors.h"

// --- Representation ---
#include "digraph.h"
#include "partial_order.h"

// --- Algorithms ---
#include "reachability.h"
#include "topological_sort.h"

// --- I/O ---
// The writers pull in <ostream>/<sstream>; include them directly:
//   #include <arkham/graph/graph_io_stream.h>
//   #include <arkham/graph/graph_io_dot.h>

#endif // ARKHAM_GRAPH_GRAPH_H
