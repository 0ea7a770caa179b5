/// \file diagnostics.cpp
/// \brief Implementation of shared diagnostics/logging helpers.

#include <abix/diagnostics.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace abix {

std::string_view category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Validation:    return "validation";
        case ErrorCategory::NotFound:      return "not-found";
        case ErrorCategory::Mismatch:      return "mismatch";
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::Unsupported:   return "unsupported";
        case ErrorCategory::SdkFailure:    return "sdk";
        case ErrorCategory::Internal:      return "internal";
    }
    return "unknown";
}

std::string error_text(const Error& error) {
    if (error.context.empty())
        return error.message;
    return error.message + " (" + error.context + ")";
}

} // namespace abix

namespace abix::diagnostics {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};
std::mutex g_io_mutex;
PerformanceCounters g_counters;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
        case LogLevel::Trace:   return "trace";
    }
    return "unknown";
}

} // namespace

Status set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
    return abix::ok();
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

Result<LogLevel> parse_log_level(std::string_view text) {
    for (auto level : {LogLevel::Error, LogLevel::Warning, LogLevel::Info,
                       LogLevel::Debug, LogLevel::Trace}) {
        if (text == level_name(level))
            return level;
    }
    return std::unexpected(Error::validation("Unknown log level", std::string(text)));
}

void log(LogLevel level, std::string_view domain, std::string_view message) {
    if (static_cast<int>(level) > static_cast<int>(log_level()))
        return;

    {
        std::lock_guard<std::mutex> lock(g_io_mutex);
        std::cerr << "[abix][" << level_name(level) << "][" << domain << "] "
                  << message << "\n";
    }
    ++g_counters.log_messages;
}

Error enrich(Error base, std::string_view context_suffix) {
    if (!base.context.empty())
        base.context += " | ";
    base.context += std::string(context_suffix);
    return base;
}

Status assert_invariant(bool condition, std::string_view message) {
    if (condition)
        return abix::ok();

    ++g_counters.invariant_failures;
    log(LogLevel::Error, "invariant", message);
    return std::unexpected(Error::internal("Invariant failed", std::string(message)));
}

void count_measurement(bool resolved) {
    ++g_counters.measurements;
    if (!resolved)
        ++g_counters.unresolved;
}

void reset_performance_counters() {
    g_counters = {};
}

PerformanceCounters performance_counters() {
    return g_counters;
}

} // namespace abix::diagnostics
