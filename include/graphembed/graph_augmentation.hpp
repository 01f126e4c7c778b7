#pragma once

/**
 * Edge-weight rank transform and diagonal augmentation.
 *
 * Both operations mutate the graph they are given. The embedders always run
 * them on their own copy of the caller's graph.
 */

#include "graphembed/graph.hpp"
#include <string>
#include <vector>

namespace graphembed {

/**
 * Statistical ranks of `values`, 1-based, ties receiving the average of the
 * ranks they span (e.g. {3, 1, 3} -> {2.5, 1, 2.5}).
 */
std::vector<double> rank_data(const std::vector<double>& values);

/**
 * Replaces each edge weight with rank * 2 / (m + 1), m being the edge count,
 * so every weight lies strictly inside (0, 2) and weight order is preserved.
 *
 * @throws UnweightedGraphError if the graph has no edges or any edge lacks `weight_attribute`
 */
WeightedGraph& rank_edges(WeightedGraph& graph, const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

/**
 * Gives every vertex exactly one self-loop weighted degree / (n - 1), where the
 * degree excludes the vertex's previous self-loop. Directed graphs use the mean
 * of weighted in- and out-degree. Running it twice gives the same self-loops
 * as running it once.
 *
 * @throws NumericalError if the graph has fewer than two vertices
 */
WeightedGraph& diagonal_augmentation(WeightedGraph& graph, const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

} // namespace graphembed
