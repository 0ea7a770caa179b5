/// \file abix_check.cpp
/// \brief Headless layout conformance check over an idalib session.
///
/// Opens the given binary with idalib, lets analysis import its debug
/// information, runs the registry against it and exits non-zero unless every
/// pair passed. The success sentinel is printed last, and only on success, so
/// CI can also grep for it.

#include <abix/abix.hpp>
#include <abix/session.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct Options {
    std::string input_file;
    std::string registry_file;
    std::vector<std::string> categories;
    std::string sentinel{abix::kDefaultSentinel};
    std::string log_level;

    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool skip_missing{false};
    bool no_plugins{false};
};

Options g_options;

void print_usage(const char* program) {
    std::cout << "abix_check - ABI layout conformance check over debug information\n\n";
    std::cout << "Usage: " << program << " [options] <binary_file>\n\n";
    std::cout << "Registry:\n";
    std::cout << "  -r, --registry <file>    pair list (default: built-in Zydis list)\n";
    std::cout << "  -c, --category <list>    comma-separated categories to check\n";
    std::cout << "  -l, --list               print the registry and exit\n\n";
    std::cout << "Output control:\n";
    std::cout << "  -v, --verbose            report passing pairs, debug logging\n";
    std::cout << "  -q, --quiet              suppress the startup banner\n";
    std::cout << "  --log-level <level>      error, warning, info, debug or trace\n";
    std::cout << "  --sentinel <text>        success line (default: \""
              << abix::kDefaultSentinel << "\")\n\n";
    std::cout << "Session:\n";
    std::cout << "  --skip-missing           succeed with a notice if the binary is absent\n";
    std::cout << "  --no-plugins             do not load user plugins\n\n";
    std::cout << "  -h, --help               show this help\n";
}

bool parse_arguments(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        }
        if (arg == "-r" || arg == "--registry") {
            if (i + 1 >= argc) {
                std::cerr << "--registry requires a file path\n";
                return false;
            }
            g_options.registry_file = argv[++i];
            continue;
        }
        if (arg == "-c" || arg == "--category") {
            if (i + 1 >= argc) {
                std::cerr << "--category requires a list\n";
                return false;
            }
            auto categories = abix::registry::split_categories(argv[++i]);
            g_options.categories.insert(g_options.categories.end(),
                                        categories.begin(), categories.end());
            continue;
        }
        if (arg == "--sentinel") {
            if (i + 1 >= argc) {
                std::cerr << "--sentinel requires a value\n";
                return false;
            }
            g_options.sentinel = argv[++i];
            if (g_options.sentinel.empty()) {
                std::cerr << "--sentinel cannot be empty\n";
                return false;
            }
            continue;
        }
        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "--log-level requires a value\n";
                return false;
            }
            g_options.log_level = argv[++i];
            continue;
        }
        if (arg == "-l" || arg == "--list") {
            g_options.list_only = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
            continue;
        }
        if (arg == "--skip-missing") {
            g_options.skip_missing = true;
            continue;
        }
        if (arg == "--no-plugins") {
            g_options.no_plugins = true;
            continue;
        }

        if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option: " << arg << "\n";
            return false;
        }

        if (g_options.input_file.empty()) {
            g_options.input_file = arg;
        } else {
            std::cerr << "multiple input files are not supported\n";
            return false;
        }
    }

    if (g_options.input_file.empty() && !g_options.list_only) {
        std::cerr << "no input file provided\n";
        return false;
    }
    return true;
}

abix::Result<abix::registry::Registry> configured_registry() {
    if (g_options.registry_file.empty())
        return abix::registry::builtin();
    return abix::registry::load(g_options.registry_file);
}

int run_check() {
    if (g_options.verbose) {
        if (auto set = abix::diagnostics::set_log_level(abix::diagnostics::LogLevel::Debug);
            !set) {
            std::cerr << "failed to set log level: " << abix::error_text(set.error()) << "\n";
            return EXIT_FAILURE;
        }
    }

    if (!g_options.log_level.empty()) {
        auto level = abix::diagnostics::parse_log_level(g_options.log_level);
        if (!level) {
            std::cerr << "invalid --log-level: " << abix::error_text(level.error()) << "\n";
            return EXIT_FAILURE;
        }
        if (auto set = abix::diagnostics::set_log_level(*level); !set) {
            std::cerr << "failed to set log level: " << abix::error_text(set.error()) << "\n";
            return EXIT_FAILURE;
        }
    }

    auto registry = configured_registry();
    if (!registry) {
        std::cerr << "failed to load registry: " << abix::error_text(registry.error()) << "\n";
        return EXIT_FAILURE;
    }

    auto selected = registry->select(g_options.categories);
    if (!selected) {
        std::cerr << "invalid --category: " << abix::error_text(selected.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (g_options.list_only) {
        std::cout << abix::registry::serialize(*selected);
        return EXIT_SUCCESS;
    }

    std::error_code ec;
    bool exists = std::filesystem::exists(g_options.input_file, ec);
    if (ec) {
        std::cerr << "cannot access input file " << g_options.input_file << ": "
                  << ec.message() << "\n";
        return EXIT_FAILURE;
    }
    if (!exists) {
        if (g_options.skip_missing) {
            std::cout << "input '" << g_options.input_file
                      << "' not built: skipping layout check\n";
            return EXIT_SUCCESS;
        }
        std::cerr << "input file does not exist: " << g_options.input_file << "\n";
        return EXIT_FAILURE;
    }

    abix::session::SessionOptions session_options;
    session_options.load_user_plugins = !g_options.no_plugins;

    abix::session::Session session;
    if (auto opened = session.open(g_options.input_file, session_options); !opened) {
        std::cerr << "failed to open analysis session: "
                  << abix::error_text(opened.error()) << "\n";
        return EXIT_FAILURE;
    }

    abix::host::SessionOracle oracle;
    if (!g_options.quiet) {
        std::cout << "abix_check\n";
        std::cout << "  Session:  " << oracle.describe() << "\n";
        std::cout << "  Pairs:    " << selected->size() << "\n\n";
    }

    abix::RunOptions run_options;
    run_options.success_sentinel = g_options.sentinel;
    run_options.report_passes = g_options.verbose;

    auto sink = [](std::string_view line) { std::cout << line << "\n"; };
    auto status = abix::conformance::check(*selected, oracle, sink, run_options);
    if (!status) {
        std::cerr << "ERROR: layout check failed: " << abix::error_text(status.error()) << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
    if (!parse_arguments(argc, argv)) {
        std::cerr << "Use --help for usage.\n";
        return EXIT_FAILURE;
    }
    return run_check();
}
