/// \file error.hpp
/// \brief Core error and result types for abix.
///
/// Provides abix::Error, abix::Result<T>, and abix::Status as the single
/// error model used by the oracle, the registry, and the conformance driver.

#ifndef ABIX_ERROR_HPP
#define ABIX_ERROR_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace abix {

// ── Error category ──────────────────────────────────────────────────────

/// Broad classification of an error's origin.
enum class ErrorCategory {
    Validation,     ///< Malformed input (reference syntax, registry line, option).
    NotFound,       ///< Type or member is absent from the session.
    Mismatch,       ///< Both sides resolved but disagree on size.
    Configuration,  ///< Session dialect was not prepared or could not be set.
    Unsupported,    ///< The session cannot answer this query.
    SdkFailure,     ///< The underlying IDA SDK call failed.
    Internal,       ///< Bug inside abix itself.
};

/// Short lower-case name of a category, for diagnostics.
std::string_view category_name(ErrorCategory category);

// ── Error ───────────────────────────────────────────────────────────────

/// Structured error value carried through every Result / Status.
struct Error {
    ErrorCategory category{ErrorCategory::Internal};
    int           code{0};
    std::string   message;
    std::string   context;

    /// Convenience constructors.
    static Error validation(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Validation, 0, std::move(msg), std::move(ctx)};
    }
    static Error not_found(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::NotFound, 0, std::move(msg), std::move(ctx)};
    }
    static Error mismatch(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Mismatch, 0, std::move(msg), std::move(ctx)};
    }
    static Error configuration(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Configuration, 0, std::move(msg), std::move(ctx)};
    }
    static Error unsupported(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Unsupported, 0, std::move(msg), std::move(ctx)};
    }
    static Error sdk(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::SdkFailure, 0, std::move(msg), std::move(ctx)};
    }
    static Error internal(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Internal, 0, std::move(msg), std::move(ctx)};
    }
};

/// "message (context)", or just the message when there is no context.
std::string error_text(const Error& error);

// ── Result / Status aliases ─────────────────────────────────────────────

/// A value-or-error return type.
template <typename T>
using Result = std::expected<T, Error>;

/// A void-or-error return type (for operations that succeed or fail).
using Status = std::expected<void, Error>;

/// Helper: return a successful void Status.
inline Status ok() { return {}; }

} // namespace abix

#endif // ABIX_ERROR_HPP
