/// \file oracle.hpp
/// \brief The Layout Oracle: compiled type sizes from a debug-info session.
///
/// LayoutOracle is the seam between the conformance driver and whatever
/// session holds the debug information. Subclasses implement dialect
/// activation and raw size resolution; the base class enforces the
/// contract shared by every backend:
///
/// - a dialect must be prepared before any reference in it is measured,
///   and the host-side activation runs once per dialect, never per call;
/// - references are parsed in their dialect before they reach the backend;
/// - a zero size is never reported as a measurement;
/// - every error names the reference and its dialect.
///
/// Nothing is cached: each measure() call asks the backend again.

#ifndef ABIX_ORACLE_HPP
#define ABIX_ORACLE_HPP

#include <abix/error.hpp>
#include <abix/reference.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace abix::oracle {

class LayoutOracle {
public:
    virtual ~LayoutOracle() = default;

    /// Activate \p dialect in the session. Idempotent.
    /// Failure is ErrorCategory::Configuration.
    Status prepare(Dialect dialect);

    [[nodiscard]] bool prepared(Dialect dialect) const noexcept;

    /// Size in bytes of \p reference as the compiler laid it out.
    /// Measuring in an unprepared dialect fails with ErrorCategory::Configuration;
    /// any other failure means the reference did not resolve.
    Result<std::uint64_t> measure(std::string_view reference, Dialect dialect);

    /// Human-readable name of the backing session, for report headers.
    [[nodiscard]] virtual std::string describe() const = 0;

protected:
    /// Put the session into \p dialect's parsing mode.
    virtual Status activate_dialect(Dialect dialect) = 0;

    /// Raw size of an already parsed reference.
    virtual Result<std::uint64_t> resolve_size(const reference::ParsedReference& ref) = 0;

private:
    std::array<bool, 2> prepared_{};
};

} // namespace abix::oracle

#endif // ABIX_ORACLE_HPP
