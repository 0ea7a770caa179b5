/// \file conformance.hpp
/// \brief The conformance driver: measure every pair, compare, report.
///
/// A run visits every pair of the registry in order. A pair whose reference
/// does not resolve is recorded as Unresolved and the run moves on; a pair
/// whose sizes differ by any amount is recorded as Fail. Only a dialect
/// configuration problem stops a run early, because it invalidates every
/// later measurement. The verdict is ok only when every pair passed.

#ifndef ABIX_CONFORMANCE_HPP
#define ABIX_CONFORMANCE_HPP

#include <abix/core.hpp>
#include <abix/error.hpp>
#include <abix/oracle.hpp>
#include <abix/registry.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace abix::conformance {

enum class Outcome {
    Pass,
    Fail,
    Unresolved,
};

enum class Side {
    Binding,
    Native,
};

std::string_view outcome_name(Outcome outcome);
std::string_view side_name(Side side);

/// Outcome of one pair.
struct PairResult {
    registry::ConformancePair pair;
    Outcome       outcome{Outcome::Unresolved};
    std::uint64_t binding_size{0};   ///< Valid unless the binding side is unresolved.
    std::uint64_t native_size{0};    ///< Valid unless the native side is unresolved.
    Side          unresolved_side{Side::Binding};
    Error         reason;            ///< Why the pair is Unresolved.
};

/// Outcomes of a whole run, in registry order.
struct Report {
    std::string             session;
    std::vector<PairResult> results;
    std::size_t             passed{0};
    std::size_t             failed{0};
    std::size_t             unresolved{0};

    [[nodiscard]] bool all_passed() const noexcept {
        return failed == 0 && unresolved == 0;
    }
};

/// Measure and compare one pair. Both dialects must already be prepared.
/// Only a Configuration error is returned as an error; everything else is
/// folded into the PairResult.
Result<PairResult> check_pair(oracle::LayoutOracle& oracle,
                              const registry::ConformancePair& pair);

/// Prepare both dialects, then check every pair of \p registry in order.
Result<Report> run(const registry::Registry& registry, oracle::LayoutOracle& oracle);

/// ok when every pair passed, otherwise ErrorCategory::Mismatch.
Status verdict(const Report& report);

/// One diagnostic line for \p result.
std::string describe(const PairResult& result);

/// "checked N pairs: P passed, F failed, U unresolved".
std::string summary(const Report& report);

/// Receives report lines (without trailing newline).
using LineSink = std::function<void(std::string_view)>;

/// Write per-pair diagnostics, the summary, and (only on success) the sentinel.
void emit(const Report& report, const LineSink& sink, const RunOptions& options);

/// Select the configured categories, run, emit, and return the verdict.
/// Setup failures are reported through \p sink before being returned.
Status check(const registry::Registry& registry,
             oracle::LayoutOracle& oracle,
             const LineSink& sink,
             const RunOptions& options = {});

} // namespace abix::conformance

#endif // ABIX_CONFORMANCE_HPP
