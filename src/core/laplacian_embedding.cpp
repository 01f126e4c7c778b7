#include "graphembed/laplacian_embedding.hpp"
#include "graphembed/connected_components.hpp"
#include "graphembed/logging.hpp"
#include "graphembed/matrix_builder.hpp"
#include "graphembed/spectral_embedding.hpp"

#include <utility>

namespace graphembed {

EmbeddingContainer laplacian_embedding(const WeightedGraph& graph, const SpectralEmbeddingOptions& options) {
    assert_single_connected_component(
        graph,
        "Run this algorithm over the largest connected component (see largest_connected_component()) "
        "or run it over every connected component separately.");

    options.validate();

    LOG_DEBUG("laplacian embedding of ", graph.vertex_count(), " vertices, ", graph.edge_count(), " edges");

    GraphMatrix augmented = augmented_adjacency_matrix(graph, options.weight_attribute);
    SparseMatrix laplacian = laplacian_matrix(augmented.matrix);

    Eigen::MatrixXd embedding = generate_embedding(
        laplacian,
        graph.is_directed() ? Directedness::DIRECTED : Directedness::UNDIRECTED,
        options);

    return EmbeddingContainer(std::move(embedding), std::move(augmented.vertex_labels));
}

} // namespace graphembed
