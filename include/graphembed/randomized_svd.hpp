#pragma once

/**
 * Randomized truncated SVD (Halko, Martinsson & Tropp).
 *
 * Algorithm:
 * 1. Draw a Gaussian test matrix with n_components + num_oversamples columns
 * 2. Run num_iterations power iterations through M and M^T, renormalizing
 *    the sample after each product (QR, LU or nothing)
 * 3. Orthonormal range basis Q = qr(M * sample)
 * 4. Exact SVD of the small matrix B = Q^T M, then U = Q * U_B
 * 5. Flip signs so the largest-magnitude entry of each left singular vector
 *    is positive (right vectors when the input was transposed)
 *
 * Inputs with fewer rows than columns are processed through their transpose.
 * The random stream is fully determined by `seed`; without one every call
 * draws a fresh seed.
 *
 * References:
 * - Halko, Martinsson & Tropp, "Finding structure with randomness", SIAM Review 53(2), 2011
 */

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cstdint>
#include <optional>
#include <string>

namespace graphembed {

enum class PowerIterationNormalizer {
    AUTO,   // NONE when num_iterations <= 2, LU otherwise
    QR,
    LU,
    NONE
};

// Accepts "auto", "QR", "LU", "none" in any case; throws InvalidArgumentError otherwise
PowerIterationNormalizer parse_power_iteration_normalizer(const std::string& name);
std::string to_string(PowerIterationNormalizer normalizer);

struct RandomizedSvdConfig {
    int num_components = 1;
    int num_oversamples = 10;
    int num_iterations = 5;
    PowerIterationNormalizer normalizer = PowerIterationNormalizer::QR;
    std::optional<std::uint64_t> seed;
};

struct SvdResult {
    Eigen::MatrixXd U;                  // rows x k
    Eigen::VectorXd singular_values;    // k, descending
    Eigen::MatrixXd Vt;                 // k x cols
};

/**
 * @throws InvalidArgumentError if num_components < 1, exceeds min(rows, cols),
 *         or num_oversamples / num_iterations are negative
 */
SvdResult randomized_svd(const Eigen::MatrixXd& matrix, const RandomizedSvdConfig& config);
SvdResult randomized_svd(const Eigen::SparseMatrix<double>& matrix, const RandomizedSvdConfig& config);

} // namespace graphembed
