#include "graphembed/graph_augmentation.hpp"
#include "graphembed/error.hpp"
#include "graphembed/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace graphembed {

std::vector<double> rank_data(const std::vector<double>& values) {
    const size_t n = values.size();
    for (size_t k = 0; k < n; ++k) {
        if (!std::isfinite(values[k])) {
            throw InvalidArgumentError("Cannot rank non-finite value at position " + std::to_string(k), __func__);
        }
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&values](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n);
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && values[order[j + 1]] == values[order[i]]) {
            ++j;
        }
        // Positions i..j (0-based) share the mean of ranks i+1..j+1
        const double average_rank = 0.5 * static_cast<double>(i + j + 2);
        for (size_t k = i; k <= j; ++k) {
            ranks[order[k]] = average_rank;
        }
        i = j + 1;
    }
    return ranks;
}

WeightedGraph& rank_edges(WeightedGraph& graph, const std::string& weight_attribute) {
    if (graph.edge_count() == 0) {
        throw UnweightedGraphError("Weight column [" + weight_attribute + "] not found in every graph edge attribute",
                                   __func__, "The graph has no edges");
    }

    std::vector<double> weights;
    weights.reserve(graph.edge_count());
    graph.for_each_edge([&](const VertexLabel& u, const VertexLabel& v, const EdgeAttributes& attributes) {
        auto it = attributes.find(weight_attribute);
        if (it == attributes.end()) {
            throw UnweightedGraphError("Weight column [" + weight_attribute + "] not found in every graph edge attribute",
                                       __func__, "Edge (" + u + ", " + v + ") has no weight");
        }
        if (!std::isfinite(it->second)) {
            throw InvalidArgumentError("Edge (" + u + ", " + v + ") has non-finite weight "
                                       + std::to_string(it->second),
                                       __func__, "Replace NaN and infinite weights before embedding");
        }
        weights.push_back(it->second);
    });

    const std::vector<double> ranks = rank_data(weights);
    const double edge_count = static_cast<double>(weights.size());

    size_t i = 0;
    graph.for_each_edge([&](const VertexLabel&, const VertexLabel&, EdgeAttributes& attributes) {
        attributes[weight_attribute] = (ranks[i++] * 2.0) / (edge_count + 1.0);
    });

    LOG_DEBUG("Ranked ", weights.size(), " edge weights");
    return graph;
}

WeightedGraph& diagonal_augmentation(WeightedGraph& graph, const std::string& weight_attribute) {
    const size_t vertex_count = graph.vertex_count();
    if (vertex_count < 2) {
        throw NumericalError("Diagonal augmentation divides by (vertex count - 1) but the graph has "
                             + std::to_string(vertex_count) + " vertices",
                             __func__, "Embed graphs with at least two vertices",
                             ErrorCode::DIVISION_BY_ZERO);
    }

    const double denominator = static_cast<double>(vertex_count - 1);
    const std::vector<VertexLabel> vertices = graph.vertices();
    for (const auto& v : vertices) {
        graph.remove_edge(v, v);

        double weighted_degree;
        if (graph.is_directed()) {
            weighted_degree = (graph.in_degree(v, weight_attribute) + graph.out_degree(v, weight_attribute)) / 2.0;
        } else {
            weighted_degree = graph.degree(v, weight_attribute);
        }

        graph.add_edge(v, v, weighted_degree / denominator, weight_attribute);
    }
    return graph;
}

} // namespace graphembed
