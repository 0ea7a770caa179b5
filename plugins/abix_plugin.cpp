/// \file abix_plugin.cpp
/// \brief Interactive entry point: check the open database from inside IDA.
///
/// Registry: the file named by ABIX_REGISTRY, or the built-in Zydis list.
/// Categories: comma-separated list in ABIX_CATEGORIES (default: all).
/// ABIX_VERBOSE=1 also reports passing pairs and enables debug logging.
/// ABIX_LOG_LEVEL (error, warning, info, debug, trace) overrides the log level.

#include <abix/abix.hpp>
#include <abix/plugin.hpp>

#include <cstdlib>
#include <string>

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value == nullptr ? std::string{} : std::string(value);
}

abix::Result<abix::registry::Registry> configured_registry() {
    std::string path = env_or_empty("ABIX_REGISTRY");
    if (path.empty())
        return abix::registry::builtin();
    return abix::registry::load(path);
}

} // namespace

struct LayoutCheckPlugin : abix::plugin::Plugin {
    abix::plugin::Info info() const override {
        return {
            .name    = "ABI layout check",
            .hotkey  = "Ctrl-Alt-L",
            .comment = "Compare binding type sizes against native types",
            .help    = "Measures every registry pair in the loaded debug information "
                       "and reports size mismatches.",
        };
    }

    abix::Status run(std::size_t) override {
        abix::RunOptions options;
        options.categories = abix::registry::split_categories(env_or_empty("ABIX_CATEGORIES"));
        if (env_or_empty("ABIX_VERBOSE") == "1") {
            options.report_passes = true;
            if (auto set = abix::diagnostics::set_log_level(abix::diagnostics::LogLevel::Debug);
                !set)
                return set;
        }
        if (auto level = env_or_empty("ABIX_LOG_LEVEL"); !level.empty()) {
            auto parsed = abix::diagnostics::parse_log_level(level);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (auto set = abix::diagnostics::set_log_level(*parsed); !set)
                return set;
        }

        auto sink = abix::host::output_sink();
        auto registry = configured_registry();
        if (!registry) {
            sink("ERROR " + abix::error_text(registry.error()));
            return std::unexpected(registry.error());
        }

        // One oracle per invocation; nothing is carried over between runs.
        abix::host::SessionOracle oracle;
        sink("abix: checking " + std::to_string(registry->size()) + " pairs in "
             + oracle.describe());
        return abix::conformance::check(*registry, oracle, sink, options);
    }
};

ABIX_PLUGIN(LayoutCheckPlugin)
