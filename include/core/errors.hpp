#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sem {

// Error taxonomy shared by every engine component
enum class ErrorKind {
    Validation,
    NotFound,
    DimensionMismatch,
    ExternalService,
    Internal
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::DimensionMismatch: return "dimension_mismatch";
        case ErrorKind::ExternalService: return "external_service";
        case ErrorKind::Internal: return "internal";
        default: return "internal";
    }
}

/**
 * @brief Base exception for all engine failures
 *
 * Synchronous requests propagate these to the caller. Clustering jobs catch
 * them on the worker and keep the message on the job record instead.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    nlohmann::json to_json() const {
        return {
            {"error", error_kind_to_string(kind_)},
            {"message", what()}
        };
    }

private:
    ErrorKind kind_;
};

class ValidationError : public EngineError {
public:
    explicit ValidationError(const std::string& message)
        : EngineError(ErrorKind::Validation, message) {}
};

class NotFoundError : public EngineError {
public:
    explicit NotFoundError(const std::string& message)
        : EngineError(ErrorKind::NotFound, message) {}
};

class DimensionMismatchError : public EngineError {
public:
    DimensionMismatchError(size_t expected, size_t actual)
        : EngineError(ErrorKind::DimensionMismatch,
                      "Vector dimension mismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)) {}
};

class ExternalServiceError : public EngineError {
public:
    explicit ExternalServiceError(const std::string& message)
        : EngineError(ErrorKind::ExternalService, message) {}
};

class InternalError : public EngineError {
public:
    explicit InternalError(const std::string& message)
        : EngineError(ErrorKind::Internal, message) {}
};

} // namespace sem
