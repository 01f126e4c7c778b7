#include "graphembed/graph.hpp"
#include "graphembed/error.hpp"

#include <algorithm>
#include <unordered_set>

namespace graphembed {

void WeightedGraph::add_vertex(const VertexLabel& v) {
    if (out_.count(v)) return;
    vertices_.push_back(v);
    out_[v];
    if (directed_) in_[v];
}

void WeightedGraph::add_edge(const VertexLabel& u, const VertexLabel& v, const EdgeAttributes& attributes) {
    add_vertex(u);
    add_vertex(v);

    out_[u].insert(v);
    if (directed_) {
        in_[v].insert(u);
    } else {
        out_[v].insert(u);
    }

    EdgeAttributes& existing = edges_[make_key(u, v)];
    for (const auto& [name, value] : attributes) {
        existing[name] = value;
    }
}

void WeightedGraph::add_edge(const VertexLabel& u, const VertexLabel& v, double weight,
                             const std::string& weight_attribute) {
    add_edge(u, v, EdgeAttributes{{weight_attribute, weight}});
}

void WeightedGraph::remove_edge(const VertexLabel& u, const VertexLabel& v) {
    auto it = edges_.find(make_key(u, v));
    if (it == edges_.end()) return;
    edges_.erase(it);

    out_[u].erase(v);
    if (directed_) {
        in_[v].erase(u);
    } else {
        out_[v].erase(u);
    }
}

void WeightedGraph::remove_vertex(const VertexLabel& v) {
    if (!has_vertex(v)) return;

    for (const auto& u : successors(v)) {
        remove_edge(v, u);
    }
    if (directed_) {
        for (const auto& u : predecessors(v)) {
            remove_edge(u, v);
        }
        in_.erase(v);
    }
    out_.erase(v);
    vertices_.erase(std::find(vertices_.begin(), vertices_.end(), v));
}

bool WeightedGraph::has_vertex(const VertexLabel& v) const {
    return out_.count(v) > 0;
}

bool WeightedGraph::has_edge(const VertexLabel& u, const VertexLabel& v) const {
    return edges_.count(make_key(u, v)) > 0;
}

std::vector<VertexLabel> WeightedGraph::sorted_vertices() const {
    std::vector<VertexLabel> sorted(vertices_);
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

std::vector<Edge> WeightedGraph::edges() const {
    std::vector<Edge> result;
    result.reserve(edges_.size());
    for (const auto& [key, attributes] : edges_) {
        result.push_back(Edge{key.first, key.second, attributes});
    }
    return result;
}

const EdgeAttributes* WeightedGraph::edge_attributes(const VertexLabel& u, const VertexLabel& v) const {
    auto it = edges_.find(make_key(u, v));
    return it == edges_.end() ? nullptr : &it->second;
}

std::optional<double> WeightedGraph::edge_weight(const VertexLabel& u, const VertexLabel& v,
                                                 const std::string& weight_attribute) const {
    const EdgeAttributes* attributes = edge_attributes(u, v);
    if (!attributes) return std::nullopt;
    auto it = attributes->find(weight_attribute);
    if (it == attributes->end()) return std::nullopt;
    return it->second;
}

void WeightedGraph::set_edge_weight(const VertexLabel& u, const VertexLabel& v, double weight,
                                    const std::string& weight_attribute) {
    auto it = edges_.find(make_key(u, v));
    if (it == edges_.end()) {
        throw InvalidArgumentError("No edge between '" + u + "' and '" + v + "'", __func__);
    }
    it->second[weight_attribute] = weight;
}

double WeightedGraph::degree(const VertexLabel& v, const std::string& weight_attribute) const {
    if (directed_) {
        return in_degree(v, weight_attribute) + out_degree(v, weight_attribute);
    }

    double total = 0.0;
    auto it = out_.find(v);
    if (it == out_.end()) return total;
    for (const auto& u : it->second) {
        double w = weight_or_one(edges_.at(make_key(v, u)), weight_attribute);
        total += (u == v) ? 2.0 * w : w;
    }
    return total;
}

double WeightedGraph::out_degree(const VertexLabel& v, const std::string& weight_attribute) const {
    if (!directed_) return degree(v, weight_attribute);

    double total = 0.0;
    auto it = out_.find(v);
    if (it == out_.end()) return total;
    for (const auto& u : it->second) {
        total += weight_or_one(edges_.at(make_key(v, u)), weight_attribute);
    }
    return total;
}

double WeightedGraph::in_degree(const VertexLabel& v, const std::string& weight_attribute) const {
    if (!directed_) return degree(v, weight_attribute);

    double total = 0.0;
    auto it = in_.find(v);
    if (it == in_.end()) return total;
    for (const auto& u : it->second) {
        total += weight_or_one(edges_.at(make_key(u, v)), weight_attribute);
    }
    return total;
}

std::vector<VertexLabel> WeightedGraph::successors(const VertexLabel& v) const {
    auto it = out_.find(v);
    if (it == out_.end()) return {};
    return std::vector<VertexLabel>(it->second.begin(), it->second.end());
}

std::vector<VertexLabel> WeightedGraph::predecessors(const VertexLabel& v) const {
    if (!directed_) return successors(v);
    auto it = in_.find(v);
    if (it == in_.end()) return {};
    return std::vector<VertexLabel>(it->second.begin(), it->second.end());
}

WeightedGraph WeightedGraph::subgraph(const std::vector<VertexLabel>& keep) const {
    std::unordered_set<VertexLabel> keep_set(keep.begin(), keep.end());

    WeightedGraph result(directed_);
    for (const auto& v : vertices_) {
        if (keep_set.count(v)) result.add_vertex(v);
    }
    for (const auto& [key, attributes] : edges_) {
        if (keep_set.count(key.first) && keep_set.count(key.second)) {
            result.add_edge(key.first, key.second, attributes);
        }
    }
    return result;
}

WeightedGraph::EdgeKey WeightedGraph::make_key(const VertexLabel& u, const VertexLabel& v) const {
    if (!directed_ && v < u) return EdgeKey(v, u);
    return EdgeKey(u, v);
}

double WeightedGraph::weight_or_one(const EdgeAttributes& attributes, const std::string& weight_attribute) const {
    auto it = attributes.find(weight_attribute);
    return it == attributes.end() ? 1.0 : it->second;
}

} // namespace graphembed
