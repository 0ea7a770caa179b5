/// \file conformance.cpp
/// \brief Implementation of abix::conformance: the per-pair driver and report.

#include <abix/conformance.hpp>
#include <abix/diagnostics.hpp>

#include <utility>

namespace abix::conformance {

namespace {

std::string category_prefix(const registry::ConformancePair& pair) {
    if (pair.category.empty())
        return {};
    return "[" + pair.category + "] ";
}

bool is_fatal(const Error& error) {
    return error.category == ErrorCategory::Configuration;
}

void tally(Report& report, const PairResult& result) {
    switch (result.outcome) {
        case Outcome::Pass:       ++report.passed;     break;
        case Outcome::Fail:       ++report.failed;     break;
        case Outcome::Unresolved: ++report.unresolved; break;
    }
}

} // namespace

std::string_view outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Pass:       return "PASS";
        case Outcome::Fail:       return "FAIL";
        case Outcome::Unresolved: return "UNRESOLVED";
    }
    return "UNKNOWN";
}

std::string_view side_name(Side side) {
    switch (side) {
        case Side::Binding: return "binding";
        case Side::Native:  return "native";
    }
    return "unknown";
}

Result<PairResult> check_pair(oracle::LayoutOracle& oracle,
                              const registry::ConformancePair& pair) {
    PairResult result;
    result.pair = pair;

    auto binding = oracle.measure(pair.binding, Dialect::Binding);
    if (!binding && is_fatal(binding.error()))
        return std::unexpected(binding.error());

    auto native = oracle.measure(pair.native, Dialect::Native);
    if (!native && is_fatal(native.error()))
        return std::unexpected(native.error());

    if (!binding || !native) {
        result.outcome = Outcome::Unresolved;
        if (!binding) {
            result.unresolved_side = Side::Binding;
            result.reason = binding.error();
            if (!native)
                result.reason = diagnostics::enrich(std::move(result.reason),
                                                    "native side: " + error_text(native.error()));
        } else {
            result.unresolved_side = Side::Native;
            result.reason = native.error();
        }
        if (binding)
            result.binding_size = *binding;
        if (native)
            result.native_size = *native;
        diagnostics::log(diagnostics::LogLevel::Warning, "conformance", describe(result));
        return result;
    }

    result.binding_size = *binding;
    result.native_size = *native;
    result.outcome = *binding == *native ? Outcome::Pass : Outcome::Fail;
    return result;
}

Result<Report> run(const registry::Registry& registry, oracle::LayoutOracle& oracle) {
    for (auto dialect : {Dialect::Binding, Dialect::Native}) {
        if (auto prepared = oracle.prepare(dialect); !prepared)
            return std::unexpected(prepared.error());
    }

    Report report;
    report.session = oracle.describe();
    report.results.reserve(registry.size());

    if (registry.empty())
        diagnostics::log(diagnostics::LogLevel::Warning, "conformance",
                         "registry is empty; nothing to check");

    for (const auto& pair : registry.pairs()) {
        auto result = check_pair(oracle, pair);
        if (!result) {
            diagnostics::log(diagnostics::LogLevel::Error, "conformance",
                             "aborting run: " + error_text(result.error()));
            return std::unexpected(result.error());
        }
        tally(report, *result);
        report.results.push_back(std::move(*result));
    }

    auto consistent = diagnostics::assert_invariant(
        report.passed + report.failed + report.unresolved == report.results.size(),
        "every pair has exactly one outcome");
    if (!consistent)
        return std::unexpected(consistent.error());
    return report;
}

Status verdict(const Report& report) {
    if (report.all_passed())
        return abix::ok();
    return std::unexpected(Error::mismatch("Layout conformance check failed", summary(report)));
}

std::string describe(const PairResult& result) {
    const auto& pair = result.pair;
    std::string line = category_prefix(pair);
    switch (result.outcome) {
        case Outcome::Pass:
            line += "binding type " + pair.binding + " matches " + pair.native
                  + " (" + std::to_string(result.binding_size) + " bytes)";
            break;
        case Outcome::Fail:
            line += "binding type " + pair.binding + " is "
                  + std::to_string(result.binding_size) + " bytes, but expected "
                  + std::to_string(result.native_size) + " (" + pair.native + ")";
            break;
        case Outcome::Unresolved: {
            const auto& ref = result.unresolved_side == Side::Binding ? pair.binding
                                                                      : pair.native;
            line += "cannot resolve " + std::string(side_name(result.unresolved_side))
                  + " reference " + ref + ": " + error_text(result.reason);
            break;
        }
    }
    return line;
}

std::string summary(const Report& report) {
    return "checked " + std::to_string(report.results.size()) + " pairs: "
         + std::to_string(report.passed) + " passed, "
         + std::to_string(report.failed) + " failed, "
         + std::to_string(report.unresolved) + " unresolved";
}

void emit(const Report& report, const LineSink& sink, const RunOptions& options) {
    for (const auto& result : report.results) {
        if (result.outcome == Outcome::Pass && !options.report_passes)
            continue;
        sink(std::string(outcome_name(result.outcome)) + " " + describe(result));
    }
    sink(summary(report));
    if (report.all_passed())
        sink(options.success_sentinel);
}

Status check(const registry::Registry& registry,
             oracle::LayoutOracle& oracle,
             const LineSink& sink,
             const RunOptions& options) {
    auto selected = registry.select(options.categories);
    if (!selected) {
        sink("ERROR " + error_text(selected.error()));
        return std::unexpected(selected.error());
    }

    auto report = run(*selected, oracle);
    if (!report) {
        sink("ERROR " + error_text(report.error()));
        return std::unexpected(report.error());
    }

    emit(*report, sink, options);
    return verdict(*report);
}

} // namespace abix::conformance
