#pragma once

/**
 * Graph -> matrix conversion for spectral embedding.
 *
 * Rows and columns follow WeightedGraph::sorted_vertices(). An undirected edge
 * (u, v) fills both (u, v) and (v, u); a self-loop fills its diagonal entry
 * once; a directed edge fills only (source, target).
 *
 * The Laplacian form is D_out^{-1/2} A D_in^{-1/2} with D_out the row sums and
 * D_in the column sums of A.
 */

#include "graphembed/graph.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <string>
#include <vector>

namespace graphembed {

using SparseMatrix = Eigen::SparseMatrix<double>;

struct GraphMatrix {
    SparseMatrix matrix;
    std::vector<VertexLabel> vertex_labels;  // row/column order
};

/**
 * Sparse adjacency matrix; edges without `weight_attribute` count as 1.
 */
GraphMatrix adjacency_matrix(const WeightedGraph& graph,
                             const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

/**
 * Copies the graph, rank-transforms its edges, augments its diagonal and
 * returns its adjacency matrix. The caller's graph is left untouched.
 */
GraphMatrix augmented_adjacency_matrix(const WeightedGraph& graph,
                                       const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

/**
 * Degree-normalized matrix D_out^{-1/2} A D_in^{-1/2}.
 * @throws NumericalError if any row or column sum is not strictly positive
 */
SparseMatrix laplacian_matrix(const SparseMatrix& adjacency);
Eigen::MatrixXd laplacian_matrix(const Eigen::MatrixXd& adjacency);

} // namespace graphembed
