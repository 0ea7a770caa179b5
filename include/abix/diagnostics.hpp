/// \file diagnostics.hpp
/// \brief Shared diagnostics, logging, and lightweight counters.

#ifndef ABIX_DIAGNOSTICS_HPP
#define ABIX_DIAGNOSTICS_HPP

#include <abix/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace abix::diagnostics {

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug,
    Trace,
};

struct PerformanceCounters {
    std::uint64_t log_messages{0};
    std::uint64_t invariant_failures{0};
    std::uint64_t measurements{0};   ///< Oracle measure() calls.
    std::uint64_t unresolved{0};     ///< Measurements that did not resolve.
};

Status set_log_level(LogLevel level);
LogLevel log_level();

/// Parse "error", "warning", "info", "debug" or "trace".
Result<LogLevel> parse_log_level(std::string_view text);

void log(LogLevel level, std::string_view domain, std::string_view message);

/// Enrich an existing error with additional context text.
Error enrich(Error base, std::string_view context_suffix);

/// Assertion-like invariant helper for non-obvious runtime expectations.
Status assert_invariant(bool condition, std::string_view message);

void count_measurement(bool resolved);

void reset_performance_counters();
PerformanceCounters performance_counters();

} // namespace abix::diagnostics

#endif // ABIX_DIAGNOSTICS_HPP
