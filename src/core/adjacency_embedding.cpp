#include "graphembed/adjacency_embedding.hpp"
#include "graphembed/connected_components.hpp"
#include "graphembed/logging.hpp"
#include "graphembed/matrix_builder.hpp"
#include "graphembed/spectral_embedding.hpp"

#include <utility>

namespace graphembed {

EmbeddingContainer adjacency_embedding(const WeightedGraph& graph, const SpectralEmbeddingOptions& options) {
    assert_single_connected_component(
        graph,
        "Run this algorithm over the largest connected component (see largest_connected_component()) "
        "or run it over every connected component separately.");

    options.validate();

    LOG_DEBUG("adjacency embedding of ", graph.vertex_count(), " vertices, ", graph.edge_count(), " edges");

    GraphMatrix augmented = augmented_adjacency_matrix(graph, options.weight_attribute);

    Eigen::MatrixXd embedding = generate_embedding(
        augmented.matrix,
        graph.is_directed() ? Directedness::DIRECTED : Directedness::UNDIRECTED,
        options);

    return EmbeddingContainer(std::move(embedding), std::move(augmented.vertex_labels));
}

} // namespace graphembed
