#include "graphembed/spectral_embedding.hpp"
#include "graphembed/elbow_finder.hpp"
#include "graphembed/error.hpp"
#include "graphembed/logging.hpp"

#include <algorithm>
#include <vector>

namespace graphembed {

namespace {

template<typename MatrixType>
Eigen::MatrixXd generate_embedding_impl(const MatrixType& matrix, Directedness directedness,
                                        const SpectralEmbeddingOptions& options) {
    options.validate();

    const Eigen::Index min_dimension = std::min(matrix.rows(), matrix.cols());
    const Eigen::Index n_components = std::min<Eigen::Index>(options.maximum_dimensions, min_dimension - 1);
    if (n_components < 1) {
        throw NumericalError("Cannot embed a " + std::to_string(matrix.rows()) + "x"
                             + std::to_string(matrix.cols()) + " matrix: no components remain",
                             "generate_embedding", "Embed graphs with at least two vertices",
                             ErrorCode::DEGENERATE_MATRIX);
    }

    LOG_DEBUG("spectral embedding into ", options.maximum_dimensions, " dimensions");

    RandomizedSvdConfig svd_config;
    svd_config.num_components = static_cast<int>(n_components);
    svd_config.num_oversamples = options.num_oversamples;
    svd_config.num_iterations = options.num_iterations;
    svd_config.normalizer = options.power_iteration_normalizer;
    svd_config.seed = options.svd_seed;

    SvdResult svd = randomized_svd(matrix, svd_config);

    LOG_DEBUG("dimension reduction (elbow selection)");
    const int dimensions = reduced_dimensions(svd.singular_values, options.elbow_cut,
                                              options.maximum_dimensions, static_cast<int>(n_components));
    LOG_DEBUG("dimension is ", dimensions);

    Eigen::MatrixXd embedding = project_embedding(svd, dimensions, directedness);
    GRAPHEMBED_CHECK(embedding.allFinite(), ErrorCode::NUMERICAL_ERROR, "Embedding contains non-finite values");
    return embedding;
}

} // namespace

Eigen::MatrixXd generate_embedding(const Eigen::SparseMatrix<double>& matrix, Directedness directedness,
                                   const SpectralEmbeddingOptions& options) {
    return generate_embedding_impl(matrix, directedness, options);
}

Eigen::MatrixXd generate_embedding(const Eigen::MatrixXd& matrix, Directedness directedness,
                                   const SpectralEmbeddingOptions& options) {
    return generate_embedding_impl(matrix, directedness, options);
}

int reduced_dimensions(const Eigen::VectorXd& singular_values, std::optional<int> elbow_cut,
                       int maximum_dimensions, int n_components) {
    GRAPHEMBED_CHECK_ARGUMENT(n_components >= 1, "n_components must be at least 1");

    int dimensions = maximum_dimensions;
    if (elbow_cut) {
        GRAPHEMBED_CHECK_ARGUMENT(*elbow_cut >= 1, "elbow_cut must be at least 1");

        std::vector<double> values(singular_values.data(), singular_values.data() + singular_values.size());
        std::vector<size_t> elbows = find_elbows(values, static_cast<size_t>(*elbow_cut));
        if (elbows.empty()) {
            LOG_WARN("No elbow found in ", values.size(), " singular values, keeping one dimension");
            dimensions = 1;
        } else if (elbows.size() < static_cast<size_t>(*elbow_cut)) {
            LOG_WARN("Requested elbow ", *elbow_cut, " but only ", elbows.size(),
                     " were found, using the last one");
            dimensions = static_cast<int>(elbows.back());
        } else {
            dimensions = static_cast<int>(elbows[static_cast<size_t>(*elbow_cut) - 1]);
        }
    }

    return std::clamp(dimensions, 1, n_components);
}

Eigen::MatrixXd project_embedding(const SvdResult& svd, int dimensions, Directedness directedness) {
    GRAPHEMBED_CHECK_ARGUMENT(dimensions >= 1 && dimensions <= svd.singular_values.size(),
                              "dimensions must be in [1, number of singular values]");

    const Eigen::Index d = dimensions;
    const Eigen::VectorXd sigma_sqrt = svd.singular_values.head(d).cwiseSqrt();

    Eigen::MatrixXd left = svd.U.leftCols(d) * sigma_sqrt.asDiagonal();
    if (directedness == Directedness::UNDIRECTED) {
        return left;
    }

    Eigen::MatrixXd right = svd.Vt.topRows(d).transpose() * sigma_sqrt.asDiagonal();

    Eigen::MatrixXd embedding(left.rows(), 2 * d);
    embedding << left, right;
    return embedding;
}

} // namespace graphembed
