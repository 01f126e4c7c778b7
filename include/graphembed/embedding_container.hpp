#pragma once

#include "graphembed/graph.hpp"

#include <Eigen/Dense>
#include <istream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphembed {

/**
 * An n x d embedding and the n vertex labels it belongs to.
 * Row i of embedding() is the vector of vertex_labels()[i].
 * Immutable once built and independent of the graph it came from.
 */
class EmbeddingContainer {
public:
    // Throws InvalidArgumentError if rows != labels
    EmbeddingContainer(Eigen::MatrixXd embedding, std::vector<VertexLabel> vertex_labels);

    const Eigen::MatrixXd& embedding() const noexcept { return embedding_; }
    const std::vector<VertexLabel>& vertex_labels() const noexcept { return vertex_labels_; }

    size_t size() const noexcept { return vertex_labels_.size(); }
    Eigen::Index dimensions() const noexcept { return embedding_.cols(); }

    std::unordered_map<VertexLabel, Eigen::VectorXd> to_dictionary() const;

    // Throws InvalidArgumentError for an unknown label
    Eigen::VectorXd vector_for(const VertexLabel& label) const;

    /**
     * Binary format (little-endian host layout):
     *   "GEMB" | u32 version | u64 rows | u64 cols | rows*cols f64 row-major |
     *   u64 label count | per label: u64 byte length, bytes
     * Doubles are written bit-for-bit, so a round trip is exact.
     */
    void serialize(std::ostream& out) const;
    static EmbeddingContainer deserialize(std::istream& in);

    void save(const std::string& path) const;
    static EmbeddingContainer load(const std::string& path);

    bool operator==(const EmbeddingContainer& other) const;
    bool operator!=(const EmbeddingContainer& other) const { return !(*this == other); }

private:
    Eigen::MatrixXd embedding_;
    std::vector<VertexLabel> vertex_labels_;
};

} // namespace graphembed
