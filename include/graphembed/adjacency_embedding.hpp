#pragma once

#include "graphembed/embedding_container.hpp"
#include "graphembed/embedding_options.hpp"
#include "graphembed/graph.hpp"

namespace graphembed {

/**
 * Adjacency spectral embedding of a single connected graph.
 *
 * Edge weights are replaced by their scaled ranks and the diagonal is
 * augmented before the augmented adjacency matrix is decomposed. Rows of the
 * result follow the sorted vertex labels. Directed graphs produce twice the
 * selected dimension.
 *
 * Throws InvalidGraphError when the graph has more than one (weakly)
 * connected component and UnweightedGraphError when an edge lacks the
 * weight attribute. The caller's graph is not modified.
 */
EmbeddingContainer adjacency_embedding(const WeightedGraph& graph,
                                       const SpectralEmbeddingOptions& options = {});

} // namespace graphembed
