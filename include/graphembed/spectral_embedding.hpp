#pragma once

#include "graphembed/embedding_options.hpp"
#include "graphembed/randomized_svd.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <optional>

namespace graphembed {

enum class Directedness {
    UNDIRECTED,
    DIRECTED
};

/**
 * Spectral embedding of a square graph matrix.
 *
 * Decomposes the matrix with a randomized SVD into
 *   n_components = min(maximum_dimensions, min(rows, cols) - 1)
 * components, truncates to the dimension picked by the elbow finder and
 * projects the left singular vectors by sqrt(singular values). Directed
 * inputs append the projected right singular vectors, doubling the width.
 *
 * Throws NumericalError (DEGENERATE_MATRIX) when n_components < 1.
 */
Eigen::MatrixXd generate_embedding(const Eigen::SparseMatrix<double>& matrix,
                                   Directedness directedness,
                                   const SpectralEmbeddingOptions& options);
Eigen::MatrixXd generate_embedding(const Eigen::MatrixXd& matrix,
                                   Directedness directedness,
                                   const SpectralEmbeddingOptions& options);

// Dimension to keep for the given singular values, in [1, n_components]
int reduced_dimensions(const Eigen::VectorXd& singular_values,
                       std::optional<int> elbow_cut,
                       int maximum_dimensions,
                       int n_components);

// [U_d * sqrt(S_d)] or, for directed inputs, [U_d * sqrt(S_d) | V_d * sqrt(S_d)]
Eigen::MatrixXd project_embedding(const SvdResult& svd, int dimensions, Directedness directedness);

} // namespace graphembed
