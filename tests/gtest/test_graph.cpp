// =============================================================================
// WeightedGraph Tests
// =============================================================================

#include <gtest/gtest.h>
#include "graphembed/error.hpp"
#include "graphembed/graph.hpp"

#include <string>
#include <vector>

using namespace graphembed;

TEST(WeightedGraphTest, AddEdgeCreatesEndpoints) {
    WeightedGraph graph;
    graph.add_edge("b", "a", 2.0);

    EXPECT_EQ(graph.vertex_count(), 2u);
    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_TRUE(graph.has_edge("a", "b"));
    EXPECT_TRUE(graph.has_edge("b", "a"));
    EXPECT_FALSE(graph.is_directed());

    // Insertion order is kept, sorted_vertices orders labels
    EXPECT_EQ(graph.vertices(), (std::vector<VertexLabel>{"b", "a"}));
    EXPECT_EQ(graph.sorted_vertices(), (std::vector<VertexLabel>{"a", "b"}));
}

TEST(WeightedGraphTest, AddEdgeMergesAttributes) {
    WeightedGraph graph;
    graph.add_edge("a", "b", EdgeAttributes{{"weight", 1.0}});
    graph.add_edge("b", "a", EdgeAttributes{{"capacity", 4.0}});

    ASSERT_EQ(graph.edge_count(), 1u);
    const EdgeAttributes* attributes = graph.edge_attributes("a", "b");
    ASSERT_NE(attributes, nullptr);
    EXPECT_DOUBLE_EQ(attributes->at("weight"), 1.0);
    EXPECT_DOUBLE_EQ(attributes->at("capacity"), 4.0);
}

TEST(WeightedGraphTest, DirectedEdgesAreOrdered) {
    WeightedGraph graph(true);
    graph.add_edge("a", "b", 1.0);

    EXPECT_TRUE(graph.has_edge("a", "b"));
    EXPECT_FALSE(graph.has_edge("b", "a"));
    EXPECT_EQ(graph.successors("a"), (std::vector<VertexLabel>{"b"}));
    EXPECT_EQ(graph.predecessors("b"), (std::vector<VertexLabel>{"a"}));
    EXPECT_TRUE(graph.predecessors("a").empty());
}

TEST(WeightedGraphTest, EdgeWeightLookup) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 3.5);
    graph.add_edge("b", "c", EdgeAttributes{});

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b").value(), 3.5);
    EXPECT_FALSE(graph.edge_weight("b", "c").has_value());
    EXPECT_FALSE(graph.edge_weight("a", "c").has_value());

    graph.set_edge_weight("c", "b", 7.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c").value(), 7.0);

    EXPECT_THROW(graph.set_edge_weight("a", "c", 1.0), InvalidArgumentError);
}

TEST(WeightedGraphTest, UndirectedDegreeCountsSelfLoopTwice) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 2.0);
    graph.add_edge("a", "a", 0.5);
    graph.add_edge("a", "c", EdgeAttributes{});  // missing weight counts as 1

    EXPECT_DOUBLE_EQ(graph.degree("a"), 2.0 + 2 * 0.5 + 1.0);
    EXPECT_DOUBLE_EQ(graph.degree("b"), 2.0);
    EXPECT_DOUBLE_EQ(graph.in_degree("b"), 2.0);
    EXPECT_DOUBLE_EQ(graph.out_degree("b"), 2.0);
}

TEST(WeightedGraphTest, DirectedDegrees) {
    WeightedGraph graph(true);
    graph.add_edge("a", "b", 2.0);
    graph.add_edge("c", "a", 3.0);
    graph.add_edge("a", "a", 1.0);

    EXPECT_DOUBLE_EQ(graph.out_degree("a"), 3.0);
    EXPECT_DOUBLE_EQ(graph.in_degree("a"), 4.0);
    EXPECT_DOUBLE_EQ(graph.degree("a"), 7.0);
}

TEST(WeightedGraphTest, RemoveVertexDropsIncidentEdges) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 1.0);
    graph.add_edge("b", "c", 1.0);
    graph.add_edge("b", "b", 1.0);

    graph.remove_vertex("b");

    EXPECT_EQ(graph.vertex_count(), 2u);
    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_FALSE(graph.has_vertex("b"));
    EXPECT_TRUE(graph.successors("a").empty());
}

TEST(WeightedGraphTest, EdgesAreCanonicallyOrdered) {
    WeightedGraph graph;
    graph.add_edge("c", "a", 1.0);
    graph.add_edge("b", "a", 2.0);

    auto edges = graph.edges();
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].source, "a");
    EXPECT_EQ(edges[0].target, "b");
    EXPECT_EQ(edges[1].source, "a");
    EXPECT_EQ(edges[1].target, "c");
}

TEST(WeightedGraphTest, SubgraphIsIndependentCopy) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 1.0);
    graph.add_edge("b", "c", 2.0);
    graph.add_edge("c", "d", 3.0);

    WeightedGraph sub = graph.subgraph({"b", "c", "x"});
    EXPECT_EQ(sub.sorted_vertices(), (std::vector<VertexLabel>{"b", "c"}));
    EXPECT_EQ(sub.edge_count(), 1u);

    sub.set_edge_weight("b", "c", 10.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c").value(), 2.0);
}
