/// \file test_harness.hpp
/// \brief Shared test utilities for all abix C++ tests.
///
/// CHECK/CHECK_OK/CHECK_VAL/CHECK_ERR macros, test counters, and sections.
/// Each test binary calls abix_test::report() from main() and returns its
/// value as the exit code.

#ifndef ABIX_TEST_HARNESS_HPP
#define ABIX_TEST_HARNESS_HPP

#include <iostream>
#include <string>
#include <string_view>

namespace abix_test {

// ── Global test counters ────────────────────────────────────────────────

inline int g_pass = 0;
inline int g_fail = 0;
inline int g_skip = 0;

// ── Section tracking ────────────────────────────────────────────────────

inline std::string g_current_section;

inline void begin_section(const char* name) {
    g_current_section = name;
    std::cout << "\n=== " << name << " ===\n";
}

// ── Core check functions ────────────────────────────────────────────────

inline void check(bool ok, const char* expr, const char* file, int line) {
    if (ok) {
        ++g_pass;
    } else {
        ++g_fail;
        std::cerr << "[FAIL] " << file << ":" << line << ": " << expr << "\n";
    }
}

inline void skip(const char* reason, const char* file, int line) {
    ++g_skip;
    std::cout << "[SKIP] " << file << ":" << line << ": " << reason << "\n";
}

// ── Report ──────────────────────────────────────────────────────────────

inline int report(const char* test_name) {
    std::cout << "\n" << test_name << ": "
              << g_pass << " passed, "
              << g_fail << " failed";
    if (g_skip > 0) {
        std::cout << ", " << g_skip << " skipped";
    }
    std::cout << "\n";
    return g_fail > 0 ? 1 : 0;
}

} // namespace abix_test

// ── Macros ──────────────────────────────────────────────────────────────

/// Basic boolean check.
#define CHECK(expr) \
    abix_test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)

/// Check that a std::expected (Result/Status) has a value.
#define CHECK_OK(expr) \
    do { \
        auto&& _r = (expr); \
        if (_r.has_value()) { \
            ++abix_test::g_pass; \
        } else { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " -> error: " \
                      << _r.error().message << " [" << _r.error().context << "]\n"; \
        } \
    } while (0)

/// Check that a std::expected has a value AND the value satisfies a predicate.
#define CHECK_VAL(expr, value_check) \
    do { \
        auto&& _r = (expr); \
        if (_r.has_value()) { \
            auto&& _v = *_r; \
            (void)_v; \
            if (value_check) { \
                ++abix_test::g_pass; \
            } else { \
                ++abix_test::g_fail; \
                std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                          << ": " << #expr << " value check failed: " << #value_check << "\n"; \
            } \
        } else { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " -> error: " \
                      << _r.error().message << " [" << _r.error().context << "]\n"; \
        } \
    } while (0)

/// Check that a std::expected has an error of a specific category.
#define CHECK_ERR(expr, cat) \
    do { \
        auto&& _r = (expr); \
        if (!_r.has_value() && _r.error().category == (cat)) { \
            ++abix_test::g_pass; \
        } else if (_r.has_value()) { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat << " but got success\n"; \
        } else { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat \
                      << " but got different error: " << _r.error().message << "\n"; \
        } \
    } while (0)

/// Check equality of two values.
#define CHECK_EQ(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (_a == _b) { \
            ++abix_test::g_pass; \
        } else { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #a << " == " << #b << "\n"; \
        } \
    } while (0)

/// Check that a string contains a substring.
#define CHECK_CONTAINS(haystack, needle) \
    do { \
        std::string _h(haystack); \
        std::string _n(needle); \
        if (_h.find(_n) != std::string::npos) { \
            ++abix_test::g_pass; \
        } else { \
            ++abix_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": \"" << _h << "\" does not contain \"" << _n << "\"\n"; \
        } \
    } while (0)

/// Skip a test with a reason.
#define SKIP(reason) \
    abix_test::skip(reason, __FILE__, __LINE__)

/// Begin a named test section.
#define SECTION(name) \
    abix_test::begin_section(name)

#endif // ABIX_TEST_HARNESS_HPP
