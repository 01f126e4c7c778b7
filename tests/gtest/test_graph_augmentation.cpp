// =============================================================================
// Edge Ranking and Diagonal Augmentation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "graphembed/error.hpp"
#include "graphembed/graph_augmentation.hpp"

#include <limits>
#include <vector>

using namespace graphembed;

TEST(RankDataTest, AverageRanksForTies) {
    auto ranks = rank_data({10.0, 30.0, 20.0, 20.0});
    ASSERT_EQ(ranks.size(), 4u);
    EXPECT_DOUBLE_EQ(ranks[0], 1.0);
    EXPECT_DOUBLE_EQ(ranks[1], 4.0);
    EXPECT_DOUBLE_EQ(ranks[2], 2.5);
    EXPECT_DOUBLE_EQ(ranks[3], 2.5);

    EXPECT_TRUE(rank_data({}).empty());
}

TEST(RankEdgesTest, ScalesRanksIntoOpenInterval) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 2.0);
    graph.add_edge("b", "c", 3.0);
    graph.add_edge("c", "a", 1.0);

    WeightedGraph& ranked = rank_edges(graph);
    EXPECT_EQ(&ranked, &graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b").value(), 1.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c").value(), 1.5);
    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "c").value(), 0.5);
}

TEST(RankEdgesTest, TiedWeightsShareRank) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 1.0);
    graph.add_edge("b", "c", 1.0);
    graph.add_edge("c", "a", 2.0);

    rank_edges(graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b").value(), 0.75);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c").value(), 0.75);
    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "c").value(), 1.5);
}

TEST(RankEdgesTest, UsesNamedAttribute) {
    WeightedGraph graph;
    graph.add_edge("a", "b", EdgeAttributes{{"strength", 5.0}, {"weight", 100.0}});
    graph.add_edge("b", "c", EdgeAttributes{{"strength", 1.0}, {"weight", 1.0}});

    rank_edges(graph, "strength");

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b", "strength").value(), 4.0 / 3.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c", "strength").value(), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b").value(), 100.0);
}

TEST(RankEdgesTest, RejectsUnweightedGraphs) {
    WeightedGraph unweighted;
    unweighted.add_edge("a", "b");
    EXPECT_THROW(rank_edges(unweighted), UnweightedGraphError);

    WeightedGraph partial;
    partial.add_edge("a", "b", 1.0);
    partial.add_edge("b", "c");
    EXPECT_THROW(rank_edges(partial), UnweightedGraphError);

    WeightedGraph empty;
    EXPECT_THROW(rank_edges(empty), UnweightedGraphError);
}

TEST(RankEdgesTest, RejectsNonFiniteWeights) {
    WeightedGraph graph;
    graph.add_edge("a", "b", 5.0);
    graph.add_edge("b", "c", std::numeric_limits<double>::quiet_NaN());
    graph.add_edge("c", "d", 1.0);
    EXPECT_THROW(rank_edges(graph), InvalidArgumentError);
    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "b").value(), 5.0);

    WeightedGraph infinite;
    infinite.add_edge("a", "b", std::numeric_limits<double>::infinity());
    EXPECT_THROW(rank_edges(infinite), InvalidArgumentError);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(rank_data({5.0, nan, 1.0, 4.0, nan, 2.0, 3.0}), InvalidArgumentError);
}

class DiagonalAugmentationTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph.add_edge("a", "b", 1.0);
        graph.add_edge("b", "c", 1.0);
    }

    WeightedGraph graph;
};

TEST_F(DiagonalAugmentationTest, AddsNormalizedDegreeSelfLoops) {
    diagonal_augmentation(graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "a").value(), 0.5);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "b").value(), 1.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("c", "c").value(), 0.5);
    EXPECT_EQ(graph.edge_count(), 5u);
}

TEST_F(DiagonalAugmentationTest, ReplacesExistingSelfLoops) {
    graph.add_edge("a", "a", 9.0);
    graph.add_edge("b", "b", 9.0);

    diagonal_augmentation(graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "a").value(), 0.5);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "b").value(), 1.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("c", "c").value(), 0.5);
}

TEST_F(DiagonalAugmentationTest, Idempotent) {
    diagonal_augmentation(graph);
    diagonal_augmentation(graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "a").value(), 0.5);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "b").value(), 1.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("c", "c").value(), 0.5);
}

TEST_F(DiagonalAugmentationTest, MissingWeightCountsAsOne) {
    graph.add_edge("c", "d");

    diagonal_augmentation(graph);

    // degree(c) = 1 + 1 over (4 - 1)
    EXPECT_DOUBLE_EQ(graph.edge_weight("c", "c").value(), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("d", "d").value(), 1.0 / 3.0);
}

TEST(DirectedDiagonalAugmentationTest, AveragesInAndOutDegree) {
    WeightedGraph graph(true);
    graph.add_edge("a", "b", 2.0);
    graph.add_edge("c", "a", 4.0);

    diagonal_augmentation(graph);

    EXPECT_DOUBLE_EQ(graph.edge_weight("a", "a").value(), ((4.0 + 2.0) / 2.0) / 2.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "b").value(), (2.0 / 2.0) / 2.0);
    EXPECT_DOUBLE_EQ(graph.edge_weight("c", "c").value(), (4.0 / 2.0) / 2.0);
}

TEST(DegenerateDiagonalAugmentationTest, SingleVertexThrows) {
    WeightedGraph graph;
    graph.add_vertex("only");

    try {
        diagonal_augmentation(graph);
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DIVISION_BY_ZERO);
    }
}
