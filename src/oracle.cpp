/// \file oracle.cpp
/// \brief Implementation of the LayoutOracle contract shared by all backends.

#include <abix/oracle.hpp>
#include <abix/diagnostics.hpp>

namespace abix::oracle {

namespace {

std::size_t slot(Dialect dialect) {
    return dialect == Dialect::Native ? 0 : 1;
}

std::string measure_context(std::string_view reference, Dialect dialect) {
    return "'" + std::string(reference) + "' in " + std::string(dialect_name(dialect))
         + " dialect";
}

} // namespace

Status LayoutOracle::prepare(Dialect dialect) {
    if (prepared_[slot(dialect)])
        return abix::ok();

    auto activated = activate_dialect(dialect);
    if (!activated) {
        Error error = activated.error();
        error.category = ErrorCategory::Configuration;
        return std::unexpected(diagnostics::enrich(
            std::move(error), "activating " + std::string(dialect_name(dialect)) + " dialect"));
    }

    prepared_[slot(dialect)] = true;
    diagnostics::log(diagnostics::LogLevel::Debug, "oracle",
                     std::string(dialect_name(dialect)) + " dialect active in " + describe());
    return abix::ok();
}

bool LayoutOracle::prepared(Dialect dialect) const noexcept {
    return prepared_[slot(dialect)];
}

Result<std::uint64_t> LayoutOracle::measure(std::string_view reference, Dialect dialect) {
    if (!prepared(dialect)) {
        return std::unexpected(Error::configuration(
            "Dialect was not selected before resolving a reference",
            measure_context(reference, dialect)));
    }

    auto parsed = reference::parse(reference, dialect);
    if (!parsed) {
        diagnostics::count_measurement(false);
        return std::unexpected(parsed.error());
    }

    auto size = resolve_size(*parsed);
    if (!size) {
        diagnostics::count_measurement(false);
        return std::unexpected(diagnostics::enrich(size.error(),
                                                   measure_context(reference, dialect)));
    }
    if (*size == 0) {
        diagnostics::count_measurement(false);
        return std::unexpected(Error::not_found("Type has no complete size",
                                                measure_context(reference, dialect)));
    }

    diagnostics::count_measurement(true);
    diagnostics::log(diagnostics::LogLevel::Debug, "oracle",
                     measure_context(reference, dialect) + " = "
                     + std::to_string(*size) + " bytes");
    return *size;
}

} // namespace abix::oracle
