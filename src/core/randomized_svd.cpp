#include "graphembed/randomized_svd.hpp"
#include "graphembed/error.hpp"
#include "graphembed/logging.hpp"

#include <Eigen/LU>
#include <Eigen/QR>
#include <Eigen/SVD>

#include <algorithm>
#include <cctype>
#include <random>

namespace graphembed {

namespace {

// Thin Q factor: rows x min(rows, cols)
Eigen::MatrixXd thin_q(const Eigen::MatrixXd& A) {
    const Eigen::Index k = std::min(A.rows(), A.cols());
    Eigen::HouseholderQR<Eigen::MatrixXd> qr(A);
    return qr.householderQ() * Eigen::MatrixXd::Identity(A.rows(), k);
}

// Permuted unit-lower factor P^T L of a pivoted LU: rows x min(rows, cols)
Eigen::MatrixXd permuted_lower(const Eigen::MatrixXd& A) {
    const Eigen::Index k = std::min(A.rows(), A.cols());
    Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
    Eigen::MatrixXd L = lu.matrixLU().leftCols(k).triangularView<Eigen::UnitLower>();
    return lu.permutationP().transpose() * L;
}

Eigen::MatrixXd gaussian_matrix(Eigen::Index rows, Eigen::Index cols, std::mt19937_64& rng) {
    std::normal_distribution<double> dist(0.0, 1.0);
    Eigen::MatrixXd sample(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            sample(i, j) = dist(rng);
        }
    }
    return sample;
}

template<typename MatrixType>
Eigen::MatrixXd range_finder(const MatrixType& A, Eigen::Index size, int num_iterations,
                             PowerIterationNormalizer normalizer, std::mt19937_64& rng) {
    Eigen::MatrixXd Q = gaussian_matrix(A.cols(), size, rng);

    if (normalizer == PowerIterationNormalizer::AUTO) {
        normalizer = num_iterations <= 2 ? PowerIterationNormalizer::NONE : PowerIterationNormalizer::LU;
    }

    for (int i = 0; i < num_iterations; ++i) {
        switch (normalizer) {
            case PowerIterationNormalizer::NONE: {
                Eigen::MatrixXd Y = A * Q;
                Q = A.transpose() * Y;
                break;
            }
            case PowerIterationNormalizer::LU: {
                Eigen::MatrixXd Y = A * Q;
                Y = permuted_lower(Y);
                Q = A.transpose() * Y;
                Q = permuted_lower(Q);
                break;
            }
            case PowerIterationNormalizer::QR:
            case PowerIterationNormalizer::AUTO: {
                Eigen::MatrixXd Y = A * Q;
                Y = thin_q(Y);
                Q = A.transpose() * Y;
                Q = thin_q(Q);
                break;
            }
        }
    }

    Eigen::MatrixXd Y = A * Q;
    return thin_q(Y);
}

// Makes the largest-magnitude entry of each column of `basis` positive,
// mirroring the flip onto the matching row of `other`
void flip_signs(Eigen::MatrixXd& basis, Eigen::MatrixXd& other_rows) {
    for (Eigen::Index c = 0; c < basis.cols(); ++c) {
        Eigen::Index max_row = 0;
        basis.col(c).cwiseAbs().maxCoeff(&max_row);
        if (basis(max_row, c) < 0.0) {
            basis.col(c) *= -1.0;
            other_rows.row(c) *= -1.0;
        }
    }
}

template<typename MatrixType>
SvdResult randomized_svd_impl(const MatrixType& matrix, const RandomizedSvdConfig& config) {
    const Eigen::Index min_dimension = std::min(matrix.rows(), matrix.cols());
    if (config.num_components < 1 || config.num_components > min_dimension) {
        throw InvalidArgumentError("num_components must be in [1, " + std::to_string(min_dimension)
                                   + "] but was " + std::to_string(config.num_components), __func__);
    }
    GRAPHEMBED_CHECK_ARGUMENT(config.num_oversamples >= 0, "num_oversamples must be non-negative");
    GRAPHEMBED_CHECK_ARGUMENT(config.num_iterations >= 0, "num_iterations must be non-negative");

    std::uint64_t seed = config.seed ? *config.seed : std::random_device{}();
    std::mt19937_64 rng(seed);

    const Eigen::Index k = config.num_components;
    const Eigen::Index n_random = k + config.num_oversamples;
    const bool transpose = matrix.rows() < matrix.cols();

    LOG_DEBUG("Randomized SVD of ", matrix.rows(), "x", matrix.cols(), " matrix, ", k,
              " components, ", n_random, " samples, ", config.num_iterations, " iterations");

    MatrixType M = transpose ? MatrixType(matrix.transpose()) : matrix;

    Eigen::MatrixXd Q = range_finder(M, n_random, config.num_iterations, config.normalizer, rng);
    Eigen::MatrixXd B = Q.transpose() * M;

    Eigen::BDCSVD<Eigen::MatrixXd> svd(B, Eigen::ComputeThinU | Eigen::ComputeThinV);
    if (svd.info() != Eigen::Success) {
        GRAPHEMBED_THROW(ErrorCode::NUMERICAL_ERROR, "SVD of the projected matrix failed");
    }
    Eigen::MatrixXd U = Q * svd.matrixU();
    Eigen::MatrixXd Vt = svd.matrixV().transpose();
    Eigen::VectorXd s = svd.singularValues();

    SvdResult result;
    if (!transpose) {
        flip_signs(U, Vt);
        result.U = U.leftCols(k);
        result.singular_values = s.head(k);
        result.Vt = Vt.topRows(k);
    } else {
        // M was matrix^T: matrix = Vt^T * S * U^T, so signs follow the right vectors
        Eigen::MatrixXd V = Vt.transpose();
        Eigen::MatrixXd Ut = U.transpose();
        flip_signs(V, Ut);
        result.U = V.leftCols(k);
        result.singular_values = s.head(k);
        result.Vt = Ut.topRows(k);
    }
    return result;
}

} // namespace

PowerIterationNormalizer parse_power_iteration_normalizer(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "auto") return PowerIterationNormalizer::AUTO;
    if (lowered == "qr") return PowerIterationNormalizer::QR;
    if (lowered == "lu") return PowerIterationNormalizer::LU;
    if (lowered == "none") return PowerIterationNormalizer::NONE;

    throw InvalidArgumentError("Unknown power iteration normalizer '" + name + "'", __func__,
                               "Use one of: auto, QR, LU, none");
}

std::string to_string(PowerIterationNormalizer normalizer) {
    switch (normalizer) {
        case PowerIterationNormalizer::AUTO: return "auto";
        case PowerIterationNormalizer::QR:   return "QR";
        case PowerIterationNormalizer::LU:   return "LU";
        case PowerIterationNormalizer::NONE: return "none";
    }
    return "unknown";
}

SvdResult randomized_svd(const Eigen::MatrixXd& matrix, const RandomizedSvdConfig& config) {
    return randomized_svd_impl(matrix, config);
}

SvdResult randomized_svd(const Eigen::SparseMatrix<double>& matrix, const RandomizedSvdConfig& config) {
    return randomized_svd_impl(matrix, config);
}

} // namespace graphembed
