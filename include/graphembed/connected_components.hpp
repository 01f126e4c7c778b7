#pragma once

#include "graphembed/graph.hpp"
#include <string>
#include <vector>

namespace graphembed {

/**
 * Connected components of a graph, each as a sorted vertex list.
 * Undirected graphs use plain connectivity. Directed graphs use weak
 * connectivity unless `weakly` is false, in which case strongly connected
 * components are returned.
 * Components are ordered by their smallest vertex label.
 */
std::vector<std::vector<VertexLabel>> connected_components(const WeightedGraph& graph, bool weakly = true);

size_t number_connected_components(const WeightedGraph& graph, bool weakly = true);

/**
 * Copy of the subgraph induced by the largest component.
 * Ties go to the component holding the smallest vertex label.
 * An empty graph yields an empty graph.
 */
WeightedGraph largest_connected_component(const WeightedGraph& graph, bool weakly = true);

// Throws InvalidGraphError if the graph has more than one (weakly) connected component
void assert_single_connected_component(const WeightedGraph& graph, const std::string& extended_message = "");

} // namespace graphembed
