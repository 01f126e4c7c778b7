#pragma once

#include "graphembed/graph.hpp"
#include "graphembed/randomized_svd.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace graphembed {

class Config;

enum class EmbeddingMethod {
    ADJACENCY = 0,
    LAPLACIAN = 1
};

// Accepts "adjacency" / "laplacian" in any case; throws InvalidTypeError otherwise
EmbeddingMethod parse_embedding_method(const std::string& name);
std::string to_string(EmbeddingMethod method);

/**
 * Options recognized by every spectral embedding call.
 */
struct SpectralEmbeddingOptions {
    int maximum_dimensions = 100;               // cap on width before directed doubling
    std::optional<int> elbow_cut = 1;           // 1-based elbow to truncate at; nullopt keeps maximum_dimensions
    std::string weight_attribute = DEFAULT_WEIGHT_ATTRIBUTE;
    std::optional<std::uint64_t> svd_seed;      // nullopt: non-reproducible
    int num_iterations = 5;
    PowerIterationNormalizer power_iteration_normalizer = PowerIterationNormalizer::QR;
    int num_oversamples = 10;

    // Throws InvalidArgumentError on out-of-range values
    void validate() const;

    // Unset keys keep the defaults above; malformed values throw InvalidArgumentError
    static SpectralEmbeddingOptions from_config(const Config& config);
};

struct OmnibusEmbeddingOptions : SpectralEmbeddingOptions {
    EmbeddingMethod embedding_method = EmbeddingMethod::LAPLACIAN;

    static OmnibusEmbeddingOptions from_config(const Config& config);
};

} // namespace graphembed
