#include "graphembed/embedding_options.hpp"
#include "graphembed/config.hpp"
#include "graphembed/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace graphembed {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Strict parse: the whole string must be a number
long long parse_integer(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw InvalidArgumentError("Config value for '" + key + "' is not an integer: '" + value + "'",
                               "SpectralEmbeddingOptions::from_config");
}

} // namespace

EmbeddingMethod parse_embedding_method(const std::string& name) {
    const std::string lowered = lowercase(name);
    if (lowered == "adjacency" || lowered == "adjacency_spectral_embedding") return EmbeddingMethod::ADJACENCY;
    if (lowered == "laplacian" || lowered == "laplacian_spectral_embedding") return EmbeddingMethod::LAPLACIAN;

    throw InvalidTypeError("Unexpected EmbeddingMethod '" + name + "'", __func__,
                           "Use 'adjacency' or 'laplacian'");
}

std::string to_string(EmbeddingMethod method) {
    switch (method) {
        case EmbeddingMethod::ADJACENCY: return "adjacency";
        case EmbeddingMethod::LAPLACIAN: return "laplacian";
    }
    throw InvalidTypeError("Unexpected EmbeddingMethod value " + std::to_string(static_cast<int>(method)), __func__);
}

void SpectralEmbeddingOptions::validate() const {
    GRAPHEMBED_CHECK_ARGUMENT(maximum_dimensions >= 1, "maximum_dimensions must be at least 1");
    GRAPHEMBED_CHECK_ARGUMENT(!elbow_cut || *elbow_cut >= 1, "elbow_cut must be at least 1 when set");
    GRAPHEMBED_CHECK_ARGUMENT(!weight_attribute.empty(), "weight_attribute must not be empty");
    GRAPHEMBED_CHECK_ARGUMENT(num_iterations >= 0, "num_iterations must be non-negative");
    GRAPHEMBED_CHECK_ARGUMENT(num_oversamples >= 0, "num_oversamples must be non-negative");
}

SpectralEmbeddingOptions SpectralEmbeddingOptions::from_config(const Config& config) {
    SpectralEmbeddingOptions options;

    if (config.has("embedding.maximum_dimensions")) {
        options.maximum_dimensions = static_cast<int>(
            parse_integer("embedding.maximum_dimensions", config.get<std::string>("embedding.maximum_dimensions")));
    }
    if (config.has("embedding.elbow_cut")) {
        const std::string value = config.get<std::string>("embedding.elbow_cut");
        if (lowercase(value) == "none") {
            options.elbow_cut = std::nullopt;
        } else {
            options.elbow_cut = static_cast<int>(parse_integer("embedding.elbow_cut", value));
        }
    }
    if (config.has("embedding.weight_attribute")) {
        options.weight_attribute = config.get<std::string>("embedding.weight_attribute");
    }
    if (config.has("embedding.svd_seed")) {
        const std::string key = "embedding.svd_seed";
        const long long seed = parse_integer(key, config.get<std::string>(key));
        GRAPHEMBED_CHECK_ARGUMENT(seed >= 0, "embedding.svd_seed must be non-negative");
        options.svd_seed = static_cast<std::uint64_t>(seed);
    }
    if (config.has("svd.num_iterations")) {
        options.num_iterations = static_cast<int>(
            parse_integer("svd.num_iterations", config.get<std::string>("svd.num_iterations")));
    }
    if (config.has("svd.power_iteration_normalizer")) {
        options.power_iteration_normalizer =
            parse_power_iteration_normalizer(config.get<std::string>("svd.power_iteration_normalizer"));
    }
    if (config.has("svd.num_oversamples")) {
        options.num_oversamples = static_cast<int>(
            parse_integer("svd.num_oversamples", config.get<std::string>("svd.num_oversamples")));
    }

    options.validate();
    return options;
}

OmnibusEmbeddingOptions OmnibusEmbeddingOptions::from_config(const Config& config) {
    OmnibusEmbeddingOptions options;
    static_cast<SpectralEmbeddingOptions&>(options) = SpectralEmbeddingOptions::from_config(config);

    if (config.has("omnibus.embedding_method")) {
        options.embedding_method = parse_embedding_method(config.get<std::string>("omnibus.embedding_method"));
    }
    return options;
}

} // namespace graphembed
