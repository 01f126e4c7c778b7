#include "graphembed/matrix_builder.hpp"
#include "graphembed/error.hpp"
#include "graphembed/graph_augmentation.hpp"
#include "graphembed/logging.hpp"

#include <cmath>
#include <unordered_map>

namespace graphembed {

namespace {

Eigen::VectorXd inverse_sqrt_degrees(const Eigen::VectorXd& degrees, const char* which) {
    Eigen::VectorXd result(degrees.size());
    for (Eigen::Index i = 0; i < degrees.size(); ++i) {
        if (!(degrees(i) > 0.0)) {
            throw NumericalError(std::string("Non-positive ") + which + " degree at row/column "
                                 + std::to_string(i) + " in Laplacian normalization",
                                 "laplacian_matrix", "Diagonally augment the graph before building the Laplacian",
                                 ErrorCode::DIVISION_BY_ZERO);
        }
        result(i) = 1.0 / std::sqrt(degrees(i));
    }
    return result;
}

} // namespace

GraphMatrix adjacency_matrix(const WeightedGraph& graph, const std::string& weight_attribute) {
    GraphMatrix result;
    result.vertex_labels = graph.sorted_vertices();

    const auto n = static_cast<Eigen::Index>(result.vertex_labels.size());
    std::unordered_map<VertexLabel, Eigen::Index> index;
    index.reserve(result.vertex_labels.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        index.emplace(result.vertex_labels[static_cast<size_t>(i)], i);
    }

    std::vector<Eigen::Triplet<double>> triplets;
    triplets.reserve(graph.edge_count() * (graph.is_directed() ? 1 : 2));

    graph.for_each_edge([&](const VertexLabel& u, const VertexLabel& v, const EdgeAttributes& attributes) {
        auto it = attributes.find(weight_attribute);
        const double weight = it == attributes.end() ? 1.0 : it->second;
        const Eigen::Index i = index.at(u);
        const Eigen::Index j = index.at(v);

        triplets.emplace_back(i, j, weight);
        if (!graph.is_directed() && i != j) {
            triplets.emplace_back(j, i, weight);
        }
    });

    result.matrix.resize(n, n);
    result.matrix.setFromTriplets(triplets.begin(), triplets.end());
    result.matrix.makeCompressed();
    return result;
}

GraphMatrix augmented_adjacency_matrix(const WeightedGraph& graph, const std::string& weight_attribute) {
    WeightedGraph working_graph = graph;

    LOG_DEBUG("rank edges");
    rank_edges(working_graph, weight_attribute);

    LOG_DEBUG("add self loops and sensible weights");
    diagonal_augmentation(working_graph, weight_attribute);

    return adjacency_matrix(working_graph, weight_attribute);
}

SparseMatrix laplacian_matrix(const SparseMatrix& adjacency) {
    Eigen::VectorXd out_degree = adjacency * Eigen::VectorXd::Ones(adjacency.cols());
    Eigen::VectorXd in_degree = adjacency.transpose() * Eigen::VectorXd::Ones(adjacency.rows());

    Eigen::VectorXd out_scale = inverse_sqrt_degrees(out_degree, "out");
    Eigen::VectorXd in_scale = inverse_sqrt_degrees(in_degree, "in");

    SparseMatrix scaled_rows = out_scale.asDiagonal() * adjacency;
    SparseMatrix result = scaled_rows * in_scale.asDiagonal();
    result.makeCompressed();
    return result;
}

Eigen::MatrixXd laplacian_matrix(const Eigen::MatrixXd& adjacency) {
    Eigen::VectorXd out_scale = inverse_sqrt_degrees(adjacency.rowwise().sum(), "out");
    Eigen::VectorXd in_scale = inverse_sqrt_degrees(adjacency.colwise().sum().transpose(), "in");
    return out_scale.asDiagonal() * adjacency * in_scale.asDiagonal();
}

} // namespace graphembed
