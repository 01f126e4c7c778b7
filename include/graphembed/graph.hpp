#pragma once

/**
 * Weighted graph used as input to every embedder.
 *
 * Vertices are identified by string labels. Edges carry a map of named numeric
 * attributes; the embedding weight is looked up by attribute name so callers
 * can keep several weightings on the same graph. The graph is simple: at most
 * one edge per ordered pair (directed) or unordered pair (undirected), and
 * re-adding an edge merges attributes into the existing one. Self-loops are
 * allowed.
 *
 * WeightedGraph has value semantics: copying it copies every vertex and edge,
 * so embedders can mutate a working copy without touching the caller's graph.
 */

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace graphembed {

using VertexLabel = std::string;
using EdgeAttributes = std::map<std::string, double>;

inline constexpr const char* DEFAULT_WEIGHT_ATTRIBUTE = "weight";

struct Edge {
    VertexLabel source;
    VertexLabel target;
    EdgeAttributes attributes;
};

class WeightedGraph {
public:
    explicit WeightedGraph(bool directed = false) : directed_(directed) {}

    bool is_directed() const noexcept { return directed_; }

    // Adds the vertex if absent
    void add_vertex(const VertexLabel& v);

    // Adds the edge (and any missing endpoint); merges attributes into an existing edge
    void add_edge(const VertexLabel& u, const VertexLabel& v, const EdgeAttributes& attributes = {});
    void add_edge(const VertexLabel& u, const VertexLabel& v, double weight,
                  const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

    // Removing something absent is a no-op
    void remove_edge(const VertexLabel& u, const VertexLabel& v);
    void remove_vertex(const VertexLabel& v);

    bool has_vertex(const VertexLabel& v) const;
    bool has_edge(const VertexLabel& u, const VertexLabel& v) const;

    size_t vertex_count() const noexcept { return vertices_.size(); }
    size_t edge_count() const noexcept { return edges_.size(); }

    // Vertices in insertion order
    const std::vector<VertexLabel>& vertices() const noexcept { return vertices_; }

    // Vertices in the deterministic order used for matrix rows/columns
    std::vector<VertexLabel> sorted_vertices() const;

    // Edges ordered by (source, target); undirected edges appear once with source <= target
    std::vector<Edge> edges() const;

    const EdgeAttributes* edge_attributes(const VertexLabel& u, const VertexLabel& v) const;
    std::optional<double> edge_weight(const VertexLabel& u, const VertexLabel& v,
                                      const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE) const;
    // Throws InvalidArgumentError if the edge does not exist
    void set_edge_weight(const VertexLabel& u, const VertexLabel& v, double weight,
                         const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE);

    // Visits (source, target, attributes) in edges() order
    template<typename Func>
    void for_each_edge(Func&& func) const {
        for (const auto& [key, attributes] : edges_) {
            func(key.first, key.second, attributes);
        }
    }

    template<typename Func>
    void for_each_edge(Func&& func) {
        for (auto& [key, attributes] : edges_) {
            func(key.first, key.second, attributes);
        }
    }

    /**
     * Weighted degrees. A missing weight attribute counts as 1.
     * degree() on an undirected graph counts a self-loop twice; on a directed
     * graph it is in_degree + out_degree.
     */
    double degree(const VertexLabel& v, const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE) const;
    double in_degree(const VertexLabel& v, const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE) const;
    double out_degree(const VertexLabel& v, const std::string& weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE) const;

    // Out-neighbors for directed graphs, all neighbors for undirected graphs
    std::vector<VertexLabel> successors(const VertexLabel& v) const;
    std::vector<VertexLabel> predecessors(const VertexLabel& v) const;

    // Copy of the subgraph induced by the given vertices (unknown labels are ignored)
    WeightedGraph subgraph(const std::vector<VertexLabel>& keep) const;

private:
    using EdgeKey = std::pair<VertexLabel, VertexLabel>;

    EdgeKey make_key(const VertexLabel& u, const VertexLabel& v) const;
    double weight_or_one(const EdgeAttributes& attributes, const std::string& weight_attribute) const;

    bool directed_;
    std::vector<VertexLabel> vertices_;
    // For undirected graphs out_ holds both directions and in_ stays empty
    std::unordered_map<VertexLabel, std::set<VertexLabel>> out_;
    std::unordered_map<VertexLabel, std::set<VertexLabel>> in_;
    std::map<EdgeKey, EdgeAttributes> edges_;
};

} // namespace graphembed
