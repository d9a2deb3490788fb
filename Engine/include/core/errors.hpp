/**
 * @file errors.hpp
 * @brief Exception hierarchy for the Reef engine
 */

#pragma once

#include <stdexcept>
#include <string>

namespace Reef {

enum class ErrorKind {
    Validation,
    Conflict,
    NotFound,
    InvalidTransition,
    VerifierUnavailable,
    ModelUnavailable,
    EmbeddingFailed,
    Policy,
    Storage,
    Config
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:          return "validation";
        case ErrorKind::Conflict:            return "conflict";
        case ErrorKind::NotFound:            return "not_found";
        case ErrorKind::InvalidTransition:   return "invalid_transition";
        case ErrorKind::VerifierUnavailable: return "verifier_unavailable";
        case ErrorKind::ModelUnavailable:    return "model_unavailable";
        case ErrorKind::EmbeddingFailed:     return "embedding_failed";
        case ErrorKind::Policy:              return "policy";
        case ErrorKind::Storage:             return "storage";
        case ErrorKind::Config:              return "config";
    }
    return "unknown";
}

/**
 * @brief Base class of every error raised by the engine.
 *
 * The kind tells callers how to react: conflicts and unavailable adapters are
 * transient and may be retried, everything else is final for the request.
 */
class ReefError : public std::runtime_error {
public:
    ReefError(ErrorKind kind, const std::string& message, const std::string& context = "")
        : std::runtime_error(format_message(kind, message, context))
        , kind_(kind)
        , context_(context) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& context() const noexcept { return context_; }

    bool retryable() const noexcept {
        return kind_ == ErrorKind::Conflict ||
               kind_ == ErrorKind::VerifierUnavailable ||
               kind_ == ErrorKind::ModelUnavailable;
    }

private:
    static std::string format_message(ErrorKind kind, const std::string& message,
                                      const std::string& context) {
        std::string result = std::string("Reef error [") + error_kind_name(kind) + "]: " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        return result;
    }

    ErrorKind kind_;
    std::string context_;
};

#define REEF_DEFINE_ERROR(Name, Kind)                                            \
    class Name : public ReefError {                                              \
    public:                                                                      \
        explicit Name(const std::string& message, const std::string& context = "") \
            : ReefError(ErrorKind::Kind, message, context) {}                    \
    };

/// Malformed input: dimension mismatch, bad normalization, proof not bound to its subject.
REEF_DEFINE_ERROR(ValidationError, Validation)
/// Optimistic concurrency check lost: the record's state changed underneath the caller.
REEF_DEFINE_ERROR(ConflictError, Conflict)
REEF_DEFINE_ERROR(NotFoundError, NotFound)
/// State pair not permitted by the lifecycle table.
REEF_DEFINE_ERROR(InvalidTransitionError, InvalidTransition)
REEF_DEFINE_ERROR(VerifierUnavailableError, VerifierUnavailable)
REEF_DEFINE_ERROR(ModelUnavailableError, ModelUnavailable)
REEF_DEFINE_ERROR(EmbeddingFailedError, EmbeddingFailed)
/// Scoring or consensus policy cannot be applied, e.g. a score dimension was never computed.
REEF_DEFINE_ERROR(PolicyError, Policy)
REEF_DEFINE_ERROR(StorageError, Storage)
REEF_DEFINE_ERROR(ConfigError, Config)

#undef REEF_DEFINE_ERROR

} // namespace Reef
