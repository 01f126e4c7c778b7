#pragma once

#include <stdexcept>
#include <string>

namespace graphembed {

/**
 * Structured error reporting for the embedding pipeline.
 * Every failure carries a code, the function it came from and, where useful,
 * a hint on how the caller can fix its input.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    INVALID_TYPE = 2,

    // Graph structure errors
    INVALID_GRAPH = 100,
    UNWEIGHTED_GRAPH = 101,

    // Mathematical errors
    NUMERICAL_ERROR = 200,
    DIVISION_BY_ZERO = 201,
    DEGENERATE_MATRIX = 202,

    // I/O errors
    FILE_NOT_FOUND = 300,
    CORRUPT_DATA = 301,

    INTERNAL_ERROR = 500
};

class GraphEmbedException : public std::runtime_error {
public:
    explicit GraphEmbedException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "graphembed error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Bad value for an otherwise well-typed argument
class InvalidArgumentError : public GraphEmbedException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GraphEmbedException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Argument of an unrecognized kind (unknown enum value or name)
class InvalidTypeError : public GraphEmbedException {
public:
    explicit InvalidTypeError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : GraphEmbedException(ErrorCode::INVALID_TYPE, message, context, suggestion) {}
};

class InvalidGraphError : public GraphEmbedException {
public:
    explicit InvalidGraphError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : GraphEmbedException(ErrorCode::INVALID_GRAPH, message, context, suggestion) {}
};

class UnweightedGraphError : public GraphEmbedException {
public:
    explicit UnweightedGraphError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GraphEmbedException(ErrorCode::UNWEIGHTED_GRAPH, message, context, suggestion) {}
};

class NumericalError : public GraphEmbedException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "",
                            ErrorCode code = ErrorCode::NUMERICAL_ERROR)
        : GraphEmbedException(code, message, context, suggestion) {}
};

class IOError : public GraphEmbedException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : GraphEmbedException(code, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw GraphEmbedException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define GRAPHEMBED_CHECK(condition, code, message) \
    graphembed::ErrorHandler::check_condition(condition, code, message, __func__)

#define GRAPHEMBED_CHECK_ARGUMENT(condition, message) \
    graphembed::ErrorHandler::check_argument(condition, message, __func__)

#define GRAPHEMBED_THROW(code, message) \
    throw graphembed::GraphEmbedException(code, message, __func__)

} // namespace graphembed
