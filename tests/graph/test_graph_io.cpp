// tests/graph/test_graph_io.cpp
// Tests for the diagnostic writers: text form and DOT export.
//
// Validates:
//   1. Text form lists nodes then edges in insertion order
//   2. partial_order is accepted wherever digraph is
//   3. DOT output quotes names and emits isolated nodes standalone
//   4. DOT escaping of quotes

#include <arkham/graph/digraph.h>
#include <arkham/graph/graph_io_dot.h>
#include <arkham/graph/graph_io_stream.h>
#include <arkham/graph/partial_order.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace ag = arkham::graph;
namespace io = arkham::graph::io;

// =============================================================================
// 1. Text form
// =============================================================================

TEST(GraphIO, WriteDigraph) {
    ag::digraph<int> g;
    g.add_node(5);
    g.add_edge(0, 1);
    g.add_edge(1, 5);

    std::ostringstream os;
    io::write(os, g);

    EXPECT_EQ(os.str(),
              "nodes 3\n"
              "node 5\n"
              "node 0\n"
              "node 1\n"
              "edge 0 1\n"
              "edge 1 5\n");
}

TEST(GraphIO, WriteEmpty) {
    ag::digraph<int> g;
    std::ostringstream os;
    io::write(os, g);
    EXPECT_EQ(os.str(), "nodes 0\n");
}

// =============================================================================
// 2. partial_order
// =============================================================================

TEST(GraphIO, WritePartialOrder) {
    ag::partial_order<std::string> po;
    po.add_edge("seal", "gate");

    std::ostringstream os;
    io::write(os, po);

    EXPECT_EQ(os.str(),
              "nodes 2\n"
              "node seal\n"
              "node gate\n"
              "edge seal gate\n");
}

// =============================================================================
// 3. DOT
// =============================================================================

TEST(GraphIO, DotOutput) {
    ag::digraph<std::string> g;
    g.add_node("Train Station");
    g.add_edge("Arkham Asylum", "Independence Square");

    std::ostringstream os;
    io::write_dot(os, g, "board");

    EXPECT_EQ(os.str(),
              "digraph board {\n"
              "  \"Train Station\";\n"
              "  \"Arkham Asylum\" -> \"Independence Square\";\n"
              "}\n");
}

TEST(GraphIO, DotDefaultName) {
    ag::digraph<int> g;
    g.add_edge(1, 2);
    std::ostringstream os;
    io::write_dot(os, g);

    auto const out = os.str();
    EXPECT_NE(out.find("digraph G {"), std::string::npos);
    EXPECT_NE(out.find("\"1\" -> \"2\";"), std::string::npos);
    // 1 and 2 are linked, so neither appears standalone.
    EXPECT_EQ(out.find("  \"1\";"), std::string::npos);
}

// =============================================================================
// 4. Escaping
// =============================================================================

TEST(GraphIO, DotEscapesQuotes) {
    ag::digraph<std::string> g;
    g.add_node("The \"Witch\" House");

    std::ostringstream os;
    io::write_dot(os, g);
    EXPECT_NE(os.str().find("\"The \\\"Witch\\\" House\";"), std::string::npos);
}
