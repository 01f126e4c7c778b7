#include "graphembed/embedding_container.hpp"
#include "graphembed/error.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <utility>

namespace graphembed {

namespace {

constexpr char MAGIC[4] = {'G', 'E', 'M', 'B'};
constexpr std::uint32_t FORMAT_VERSION = 1;

// Guards against overflowing the element count of a corrupt header
constexpr std::uint64_t MAX_ELEMENTS = std::uint64_t{1} << 40;

// Largest block read ahead of the data actually present in the stream
constexpr std::uint64_t READ_CHUNK = std::uint64_t{1} << 16;

template<typename T>
void write_pod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template<typename T>
T read_pod(std::istream& in, const char* what) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) {
        throw IOError(std::string("Unexpected end of stream while reading ") + what,
                      "EmbeddingContainer::deserialize", "", ErrorCode::CORRUPT_DATA);
    }
    return value;
}

// Reads `count` bytes, growing the buffer only as data arrives
std::string read_bytes(std::istream& in, std::uint64_t count, const char* what) {
    std::string bytes;
    while (bytes.size() < count) {
        const std::uint64_t chunk = std::min<std::uint64_t>(count - bytes.size(), READ_CHUNK);
        const size_t offset = bytes.size();
        bytes.resize(offset + static_cast<size_t>(chunk));
        in.read(bytes.data() + offset, static_cast<std::streamsize>(chunk));
        if (!in) {
            throw IOError(std::string("Unexpected end of stream while reading ") + what,
                          "EmbeddingContainer::deserialize", "", ErrorCode::CORRUPT_DATA);
        }
    }
    return bytes;
}

} // namespace

EmbeddingContainer::EmbeddingContainer(Eigen::MatrixXd embedding, std::vector<VertexLabel> vertex_labels)
    : embedding_(std::move(embedding))
    , vertex_labels_(std::move(vertex_labels)) {
    if (static_cast<size_t>(embedding_.rows()) != vertex_labels_.size()) {
        throw InvalidArgumentError("Embedding has " + std::to_string(embedding_.rows()) + " rows but "
                                   + std::to_string(vertex_labels_.size()) + " vertex labels",
                                   __func__);
    }
}

std::unordered_map<VertexLabel, Eigen::VectorXd> EmbeddingContainer::to_dictionary() const {
    std::unordered_map<VertexLabel, Eigen::VectorXd> dictionary;
    dictionary.reserve(vertex_labels_.size());
    for (size_t i = 0; i < vertex_labels_.size(); ++i) {
        dictionary[vertex_labels_[i]] = embedding_.row(static_cast<Eigen::Index>(i)).transpose();
    }
    return dictionary;
}

Eigen::VectorXd EmbeddingContainer::vector_for(const VertexLabel& label) const {
    for (size_t i = 0; i < vertex_labels_.size(); ++i) {
        if (vertex_labels_[i] == label) {
            return embedding_.row(static_cast<Eigen::Index>(i)).transpose();
        }
    }
    throw InvalidArgumentError("Vertex '" + label + "' is not in the embedding", __func__);
}

void EmbeddingContainer::serialize(std::ostream& out) const {
    out.write(MAGIC, sizeof(MAGIC));
    write_pod(out, FORMAT_VERSION);
    write_pod(out, static_cast<std::uint64_t>(embedding_.rows()));
    write_pod(out, static_cast<std::uint64_t>(embedding_.cols()));

    for (Eigen::Index r = 0; r < embedding_.rows(); ++r) {
        for (Eigen::Index c = 0; c < embedding_.cols(); ++c) {
            write_pod(out, embedding_(r, c));
        }
    }

    write_pod(out, static_cast<std::uint64_t>(vertex_labels_.size()));
    for (const auto& label : vertex_labels_) {
        write_pod(out, static_cast<std::uint64_t>(label.size()));
        out.write(label.data(), static_cast<std::streamsize>(label.size()));
    }

    if (!out) {
        throw IOError("Failed writing embedding container", __func__);
    }
}

EmbeddingContainer EmbeddingContainer::deserialize(std::istream& in) {
    char magic[4] = {};
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
        throw IOError("Stream does not hold a serialized embedding container", __func__, "",
                      ErrorCode::CORRUPT_DATA);
    }

    const auto version = read_pod<std::uint32_t>(in, "version");
    if (version != FORMAT_VERSION) {
        throw IOError("Unsupported embedding container version " + std::to_string(version), __func__, "",
                      ErrorCode::CORRUPT_DATA);
    }

    const auto rows = read_pod<std::uint64_t>(in, "row count");
    const auto cols = read_pod<std::uint64_t>(in, "column count");
    if (rows > MAX_ELEMENTS || cols > MAX_ELEMENTS || (rows != 0 && cols > MAX_ELEMENTS / rows)) {
        throw IOError("Implausible embedding shape in header", __func__, "", ErrorCode::CORRUPT_DATA);
    }

    // Values are stored row-major; nothing is allocated up front for the header's shape
    const std::string payload = read_bytes(in, rows * cols * sizeof(double), "embedding values");
    Eigen::MatrixXd embedding(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (Eigen::Index r = 0; r < embedding.rows(); ++r) {
        for (Eigen::Index c = 0; c < embedding.cols(); ++c) {
            const size_t offset = static_cast<size_t>(r * embedding.cols() + c) * sizeof(double);
            std::memcpy(&embedding(r, c), payload.data() + offset, sizeof(double));
        }
    }

    const auto label_count = read_pod<std::uint64_t>(in, "label count");
    if (label_count != rows) {
        throw IOError("Label count " + std::to_string(label_count) + " does not match "
                      + std::to_string(rows) + " rows", __func__, "", ErrorCode::CORRUPT_DATA);
    }

    std::vector<VertexLabel> labels;
    for (std::uint64_t i = 0; i < label_count; ++i) {
        const auto length = read_pod<std::uint64_t>(in, "label length");
        if (length > MAX_ELEMENTS) {
            throw IOError("Implausible label length in stream", __func__, "", ErrorCode::CORRUPT_DATA);
        }
        labels.push_back(read_bytes(in, length, "labels"));
    }

    return EmbeddingContainer(std::move(embedding), std::move(labels));
}

void EmbeddingContainer::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Cannot open '" + path + "' for writing", __func__);
    }
    serialize(out);
}

EmbeddingContainer EmbeddingContainer::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("Cannot open '" + path + "' for reading", __func__);
    }
    return deserialize(in);
}

bool EmbeddingContainer::operator==(const EmbeddingContainer& other) const {
    return vertex_labels_ == other.vertex_labels_
        && embedding_.rows() == other.embedding_.rows()
        && embedding_.cols() == other.embedding_.cols()
        && embedding_ == other.embedding_;
}

} // namespace graphembed
