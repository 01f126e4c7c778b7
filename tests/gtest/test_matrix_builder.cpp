// =============================================================================
// Adjacency and Laplacian Matrix Tests
// =============================================================================

#include <gtest/gtest.h>
#include "graphembed/error.hpp"
#include "graphembed/matrix_builder.hpp"

#include <Eigen/Dense>
#include <cmath>
#include <vector>

using namespace graphembed;

class MatrixBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph.add_edge("b", "c", 2.0);
        graph.add_edge("a", "b", 1.0);
    }

    WeightedGraph graph;
};

TEST_F(MatrixBuilderTest, AdjacencyRowsFollowSortedLabels) {
    GraphMatrix adjacency = adjacency_matrix(graph);

    EXPECT_EQ(adjacency.vertex_labels, (std::vector<VertexLabel>{"a", "b", "c"}));

    Eigen::MatrixXd expected(3, 3);
    expected << 0, 1, 0,
                1, 0, 2,
                0, 2, 0;
    EXPECT_TRUE(Eigen::MatrixXd(adjacency.matrix).isApprox(expected));
}

TEST_F(MatrixBuilderTest, SelfLoopsAppearOnce) {
    graph.add_edge("a", "a", 0.25);
    GraphMatrix adjacency = adjacency_matrix(graph);
    EXPECT_DOUBLE_EQ(adjacency.matrix.coeff(0, 0), 0.25);
}

TEST_F(MatrixBuilderTest, AugmentedAdjacencyMatrix) {
    GraphMatrix augmented = augmented_adjacency_matrix(graph);

    // Ranks 1 and 2 scale to 2/3 and 4/3; diagonal is degree / 2
    Eigen::MatrixXd expected(3, 3);
    expected << 1.0 / 3.0, 2.0 / 3.0, 0.0,
                2.0 / 3.0, 1.0,       4.0 / 3.0,
                0.0,       4.0 / 3.0, 2.0 / 3.0;
    EXPECT_TRUE(Eigen::MatrixXd(augmented.matrix).isApprox(expected, 1e-12));

    // The input graph is left alone
    EXPECT_DOUBLE_EQ(graph.edge_weight("b", "c").value(), 2.0);
    EXPECT_FALSE(graph.has_edge("a", "a"));
}

TEST_F(MatrixBuilderTest, DirectedAdjacencyIsNotSymmetric) {
    WeightedGraph directed(true);
    directed.add_edge("a", "b", 3.0);
    directed.add_edge("b", "c", 1.0);

    GraphMatrix adjacency = adjacency_matrix(directed);
    EXPECT_DOUBLE_EQ(adjacency.matrix.coeff(0, 1), 3.0);
    EXPECT_DOUBLE_EQ(adjacency.matrix.coeff(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(adjacency.matrix.coeff(1, 2), 1.0);
}

TEST_F(MatrixBuilderTest, LaplacianNormalization) {
    GraphMatrix augmented = augmented_adjacency_matrix(graph);
    SparseMatrix laplacian = laplacian_matrix(augmented.matrix);

    // Degrees of the augmented matrix are 1, 3 and 2
    const Eigen::Vector3d degrees(1.0, 3.0, 2.0);
    Eigen::MatrixXd dense(augmented.matrix);
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            EXPECT_NEAR(laplacian.coeff(i, j), dense(i, j) / std::sqrt(degrees(i) * degrees(j)), 1e-12);
        }
    }

    // sqrt(degree) is an eigenvector with eigenvalue 1
    Eigen::VectorXd root = degrees.cwiseSqrt();
    Eigen::VectorXd image = laplacian * root;
    EXPECT_TRUE(image.isApprox(root, 1e-12));
}

TEST_F(MatrixBuilderTest, DenseLaplacianMatchesSparse) {
    GraphMatrix augmented = augmented_adjacency_matrix(graph);
    Eigen::MatrixXd dense = laplacian_matrix(Eigen::MatrixXd(augmented.matrix));
    Eigen::MatrixXd sparse(laplacian_matrix(augmented.matrix));
    EXPECT_TRUE(dense.isApprox(sparse, 1e-12));
}

TEST_F(MatrixBuilderTest, DirectedLaplacianUsesRowAndColumnSums) {
    Eigen::MatrixXd adjacency(2, 2);
    adjacency << 1, 3,
                 1, 1;
    // out (row sums) = 4, 2; in (column sums) = 2, 4
    Eigen::MatrixXd laplacian = laplacian_matrix(adjacency);
    EXPECT_NEAR(laplacian(0, 0), 1.0 / std::sqrt(4.0 * 2.0), 1e-12);
    EXPECT_NEAR(laplacian(0, 1), 3.0 / std::sqrt(4.0 * 4.0), 1e-12);
    EXPECT_NEAR(laplacian(1, 0), 1.0 / std::sqrt(2.0 * 2.0), 1e-12);
    EXPECT_NEAR(laplacian(1, 1), 1.0 / std::sqrt(2.0 * 4.0), 1e-12);
}

TEST_F(MatrixBuilderTest, LaplacianRejectsZeroDegree) {
    Eigen::MatrixXd adjacency = Eigen::MatrixXd::Zero(2, 2);
    adjacency(0, 1) = 1.0;

    try {
        laplacian_matrix(adjacency);
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DIVISION_BY_ZERO);
    }
}
