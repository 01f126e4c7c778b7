#pragma once

#include "graphembed/embedding_container.hpp"
#include "graphembed/embedding_options.hpp"
#include "graphembed/graph.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <utility>
#include <vector>

namespace graphembed {

using EmbeddingPair = std::pair<EmbeddingContainer, EmbeddingContainer>;

/**
 * Omnibus matrix of k same-shaped matrices M_1..M_k: a k x k block matrix
 * whose block (i, j) is M_i on the diagonal and (M_i + M_j) / 2 elsewhere.
 *
 * Throws InvalidArgumentError for an empty list or mismatched shapes.
 */
Eigen::MatrixXd generate_omnibus_matrix(const std::vector<Eigen::MatrixXd>& matrices);
Eigen::SparseMatrix<double> generate_omnibus_matrix(const std::vector<Eigen::SparseMatrix<double>>& matrices);

// Copies of the graphs, each induced on the vertices present in every graph
std::vector<WeightedGraph> reduce_to_common_vertices(const std::vector<WeightedGraph>& graphs);

/**
 * Pairwise omnibus embedding of consecutive graphs.
 *
 * For every pair (graphs[i], graphs[i + 1]) both graphs are reduced to their
 * largest connected component, rank-normalized and diagonally augmented,
 * restricted to their common vertices, turned into adjacency or Laplacian
 * matrices and embedded jointly through their omnibus matrix. The result
 * holds one pair of containers per consecutive pair, both keyed by the same
 * sorted common labels.
 *
 * Throws InvalidArgumentError for fewer than two graphs, mixed directedness
 * or a pair that degenerates to fewer than two common vertices.
 */
std::vector<EmbeddingPair> omnibus_embedding(const std::vector<WeightedGraph>& graphs,
                                             const OmnibusEmbeddingOptions& options = {});

} // namespace graphembed
