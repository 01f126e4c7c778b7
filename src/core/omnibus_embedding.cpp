#include "graphembed/omnibus_embedding.hpp"
#include "graphembed/connected_components.hpp"
#include "graphembed/error.hpp"
#include "graphembed/graph_augmentation.hpp"
#include "graphembed/logging.hpp"
#include "graphembed/matrix_builder.hpp"
#include "graphembed/spectral_embedding.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace graphembed {

namespace {

template<typename MatrixType>
void check_omnibus_inputs(const std::vector<MatrixType>& matrices) {
    GRAPHEMBED_CHECK_ARGUMENT(!matrices.empty(), "At least one matrix is required to build an omnibus matrix");

    const Eigen::Index rows = matrices.front().rows();
    const Eigen::Index cols = matrices.front().cols();
    for (size_t i = 1; i < matrices.size(); ++i) {
        if (matrices[i].rows() != rows || matrices[i].cols() != cols) {
            throw InvalidArgumentError("Matrix " + std::to_string(i) + " is " + std::to_string(matrices[i].rows())
                                       + "x" + std::to_string(matrices[i].cols()) + " but matrix 0 is "
                                       + std::to_string(rows) + "x" + std::to_string(cols),
                                       "generate_omnibus_matrix");
        }
    }
}

void require_embeddable(const WeightedGraph& graph, size_t index, const char* stage) {
    if (graph.vertex_count() < 2) {
        throw InvalidArgumentError("Graph " + std::to_string(index) + " has " + std::to_string(graph.vertex_count())
                                   + " vertices " + stage + "; at least two are required",
                                   "omnibus_embedding",
                                   "Provide graphs whose largest connected components share at least two vertices");
    }
}

WeightedGraph prepare_graph(const WeightedGraph& graph, const std::string& weight_attribute, size_t index) {
    WeightedGraph component = largest_connected_component(graph);
    require_embeddable(component, index, "in its largest connected component");

    rank_edges(component, weight_attribute);
    diagonal_augmentation(component, weight_attribute);
    return component;
}

std::vector<SparseMatrix> pair_matrices(const std::vector<WeightedGraph>& pair, EmbeddingMethod method,
                                        const std::string& weight_attribute,
                                        std::vector<VertexLabel>& labels) {
    std::vector<SparseMatrix> matrices;
    matrices.reserve(pair.size());

    for (const auto& graph : pair) {
        GraphMatrix adjacency = adjacency_matrix(graph, weight_attribute);
        if (labels.empty()) {
            labels = adjacency.vertex_labels;
        }

        switch (method) {
            case EmbeddingMethod::ADJACENCY:
                matrices.push_back(std::move(adjacency.matrix));
                break;
            case EmbeddingMethod::LAPLACIAN:
                matrices.push_back(laplacian_matrix(adjacency.matrix));
                break;
        }
    }
    return matrices;
}

} // namespace

Eigen::MatrixXd generate_omnibus_matrix(const std::vector<Eigen::MatrixXd>& matrices) {
    check_omnibus_inputs(matrices);

    const Eigen::Index rows = matrices.front().rows();
    const Eigen::Index cols = matrices.front().cols();
    const auto k = static_cast<Eigen::Index>(matrices.size());

    Eigen::MatrixXd omnibus(rows * k, cols * k);
    for (Eigen::Index i = 0; i < k; ++i) {
        const auto& current = matrices[static_cast<size_t>(i)];
        for (Eigen::Index j = 0; j < k; ++j) {
            auto block = omnibus.block(i * rows, j * cols, rows, cols);
            if (i == j) {
                block = current;
            } else {
                block = 0.5 * (current + matrices[static_cast<size_t>(j)]);
            }
        }
    }
    return omnibus;
}

Eigen::SparseMatrix<double> generate_omnibus_matrix(const std::vector<Eigen::SparseMatrix<double>>& matrices) {
    check_omnibus_inputs(matrices);

    const Eigen::Index rows = matrices.front().rows();
    const Eigen::Index cols = matrices.front().cols();
    const auto k = static_cast<Eigen::Index>(matrices.size());

    std::vector<Eigen::Triplet<double>> triplets;
    Eigen::Index nonzeros = 0;
    for (const auto& m : matrices) nonzeros += m.nonZeros();
    triplets.reserve(static_cast<size_t>(nonzeros * k));

    // Off-diagonal blocks are 0.5 * (M_i + M_j): every matrix contributes
    // half of itself to each block in its row and block column
    for (Eigen::Index i = 0; i < k; ++i) {
        const auto& m = matrices[static_cast<size_t>(i)];
        for (Eigen::Index outer = 0; outer < m.outerSize(); ++outer) {
            for (Eigen::SparseMatrix<double>::InnerIterator it(m, outer); it; ++it) {
                for (Eigen::Index j = 0; j < k; ++j) {
                    if (i == j) {
                        triplets.emplace_back(i * rows + it.row(), i * cols + it.col(), it.value());
                    } else {
                        triplets.emplace_back(i * rows + it.row(), j * cols + it.col(), 0.5 * it.value());
                        triplets.emplace_back(j * rows + it.row(), i * cols + it.col(), 0.5 * it.value());
                    }
                }
            }
        }
    }

    Eigen::SparseMatrix<double> omnibus(rows * k, cols * k);
    omnibus.setFromTriplets(triplets.begin(), triplets.end());
    omnibus.makeCompressed();
    return omnibus;
}

std::vector<WeightedGraph> reduce_to_common_vertices(const std::vector<WeightedGraph>& graphs) {
    if (graphs.empty()) {
        return {};
    }

    std::vector<VertexLabel> common = graphs.front().sorted_vertices();
    for (size_t i = 1; i < graphs.size(); ++i) {
        std::vector<VertexLabel> next = graphs[i].sorted_vertices();
        std::vector<VertexLabel> intersection;
        std::set_intersection(common.begin(), common.end(), next.begin(), next.end(),
                              std::back_inserter(intersection));
        common = std::move(intersection);
    }

    std::vector<WeightedGraph> reduced;
    reduced.reserve(graphs.size());
    for (const auto& graph : graphs) {
        reduced.push_back(graph.subgraph(common));
    }
    return reduced;
}

std::vector<EmbeddingPair> omnibus_embedding(const std::vector<WeightedGraph>& graphs,
                                             const OmnibusEmbeddingOptions& options) {
    if (graphs.size() < 2) {
        throw InvalidArgumentError("You must provide at least two graphs to compute the omnibus embedding but there "
                                   "were only " + std::to_string(graphs.size()) + " graphs",
                                   __func__);
    }

    const bool directed = graphs.front().is_directed();
    for (const auto& graph : graphs) {
        GRAPHEMBED_CHECK_ARGUMENT(graph.is_directed() == directed,
                                  "All graphs must be either directed or all must be undirected");
    }

    const std::string method = to_string(options.embedding_method);
    options.validate();

    LOG_INFO("Generating ", method, " matrices from ", graphs.size(), " graphs");

    const Directedness directedness = directed ? Directedness::DIRECTED : Directedness::UNDIRECTED;

    std::vector<EmbeddingPair> result;
    result.reserve(graphs.size() - 1);

    LOG_INFO("Generating the omnibus embedding");
    for (size_t i = 0; i + 1 < graphs.size(); ++i) {
        LOG_DEBUG("Calculating omni for graph ", i + 1, " of ", graphs.size() - 1);

        std::vector<WeightedGraph> pair;
        pair.push_back(prepare_graph(graphs[i], options.weight_attribute, i));
        pair.push_back(prepare_graph(graphs[i + 1], options.weight_attribute, i + 1));

        std::vector<WeightedGraph> reduced = reduce_to_common_vertices(pair);
        require_embeddable(reduced.front(), i, "in common with the next graph");

        std::vector<VertexLabel> labels;
        std::vector<SparseMatrix> matrices =
            pair_matrices(reduced, options.embedding_method, options.weight_attribute, labels);

        SparseMatrix omnibus = generate_omnibus_matrix(matrices);
        Eigen::MatrixXd embedding = generate_embedding(omnibus, directedness, options);

        const auto n = static_cast<Eigen::Index>(labels.size());
        Eigen::MatrixXd first = embedding.topRows(n);
        Eigen::MatrixXd second = embedding.bottomRows(n);

        result.emplace_back(EmbeddingContainer(std::move(first), labels),
                            EmbeddingContainer(std::move(second), labels));
    }

    return result;
}

} // namespace graphembed
