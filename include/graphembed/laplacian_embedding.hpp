#pragma once

#include "graphembed/embedding_container.hpp"
#include "graphembed/embedding_options.hpp"
#include "graphembed/graph.hpp"

namespace graphembed {

// Same pipeline as adjacency_embedding, decomposing D_out^-1/2 A D_in^-1/2
// of the augmented adjacency matrix A instead of A itself
EmbeddingContainer laplacian_embedding(const WeightedGraph& graph,
                                       const SpectralEmbeddingOptions& options = {});

} // namespace graphembed
