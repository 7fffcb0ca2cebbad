#ifndef DEPINFER_EXCEPTIONS_H
#define DEPINFER_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace DepInfer {

class DepInferException : public std::runtime_error {
public:
    explicit DepInferException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public DepInferException {
public:
    explicit IOException(const std::string& message) : DepInferException("IO Error: " + message) {}
};

class ConfigurationException : public DepInferException {
public:
    explicit ConfigurationException(const std::string& message) : DepInferException("Configuration Error: " + message) {}
};

// Rejected caller input: shapes, alignment, missing values, option ranges.
class ValidationException : public DepInferException {
public:
    explicit ValidationException(const std::string& message) : DepInferException("Validation Error: " + message) {}

protected:
    struct RawTag {};
    ValidationException(RawTag, const std::string& message) : DepInferException(message) {}
};

class DegenerateClusterException : public ValidationException {
public:
    explicit DegenerateClusterException(const std::string& message)
        : ValidationException(RawTag{}, "Degenerate Clustering: " + message) {}
};

class SolverException : public DepInferException {
public:
    explicit SolverException(const std::string& message) : DepInferException("Solver Error: " + message) {}
};

} // namespace DepInfer

#endif // DEPINFER_EXCEPTIONS_H
