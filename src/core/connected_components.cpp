#include "graphembed/connected_components.hpp"
#include "graphembed/error.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace graphembed {

namespace {

std::vector<std::vector<VertexLabel>> weak_components(const WeightedGraph& graph) {
    std::vector<std::vector<VertexLabel>> components;
    std::unordered_set<VertexLabel> visited;

    for (const auto& start : graph.sorted_vertices()) {
        if (visited.count(start)) continue;

        std::vector<VertexLabel> component;
        std::queue<VertexLabel> frontier;
        frontier.push(start);
        visited.insert(start);

        while (!frontier.empty()) {
            VertexLabel v = frontier.front();
            frontier.pop();
            component.push_back(v);

            auto visit = [&](const VertexLabel& u) {
                if (visited.insert(u).second) frontier.push(u);
            };
            for (const auto& u : graph.successors(v)) visit(u);
            if (graph.is_directed()) {
                for (const auto& u : graph.predecessors(v)) visit(u);
            }
        }

        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    return components;
}

// Kosaraju: finish order on the graph, then sweep the reversed graph
std::vector<std::vector<VertexLabel>> strong_components(const WeightedGraph& graph) {
    const auto vertices = graph.sorted_vertices();

    std::vector<VertexLabel> finish_order;
    finish_order.reserve(vertices.size());
    std::unordered_set<VertexLabel> visited;

    for (const auto& root : vertices) {
        if (visited.count(root)) continue;

        // (vertex, successors, next successor index)
        std::stack<std::pair<VertexLabel, std::pair<std::vector<VertexLabel>, size_t>>> stack;
        visited.insert(root);
        stack.push({root, {graph.successors(root), 0}});

        while (!stack.empty()) {
            auto& [v, state] = stack.top();
            auto& [next, index] = state;
            if (index < next.size()) {
                const VertexLabel u = next[index++];
                if (visited.insert(u).second) {
                    stack.push({u, {graph.successors(u), 0}});
                }
            } else {
                finish_order.push_back(v);
                stack.pop();
            }
        }
    }

    std::vector<std::vector<VertexLabel>> components;
    std::unordered_set<VertexLabel> assigned;
    for (auto it = finish_order.rbegin(); it != finish_order.rend(); ++it) {
        if (assigned.count(*it)) continue;

        std::vector<VertexLabel> component;
        std::stack<VertexLabel> pending;
        pending.push(*it);
        assigned.insert(*it);
        while (!pending.empty()) {
            VertexLabel v = pending.top();
            pending.pop();
            component.push_back(v);
            for (const auto& u : graph.predecessors(v)) {
                if (assigned.insert(u).second) pending.push(u);
            }
        }

        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }

    std::sort(components.begin(), components.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });
    return components;
}

} // namespace

std::vector<std::vector<VertexLabel>> connected_components(const WeightedGraph& graph, bool weakly) {
    if (graph.is_directed() && !weakly) {
        return strong_components(graph);
    }
    return weak_components(graph);
}

size_t number_connected_components(const WeightedGraph& graph, bool weakly) {
    return connected_components(graph, weakly).size();
}

WeightedGraph largest_connected_component(const WeightedGraph& graph, bool weakly) {
    const auto components = connected_components(graph, weakly);
    if (components.empty()) {
        return WeightedGraph(graph.is_directed());
    }

    // Components are ordered by smallest label, so the first maximum wins ties
    auto largest = std::max_element(components.begin(), components.end(),
                                    [](const auto& a, const auto& b) { return a.size() < b.size(); });
    return graph.subgraph(*largest);
}

void assert_single_connected_component(const WeightedGraph& graph, const std::string& extended_message) {
    if (number_connected_components(graph) <= 1) return;

    const std::string kind = graph.is_directed() ? "weakly connected component" : "connected component";
    std::string message = "The graph provided has more than one " + kind + ".";
    if (!extended_message.empty()) {
        message += "  " + extended_message;
    }
    throw InvalidGraphError(message, __func__,
                            "Reduce the graph with largest_connected_component() or embed each component separately");
}

} // namespace graphembed
