/// \file session.cpp
/// \brief Implementation of abix::session (idalib-only).
///
/// These functions reference idalib-only symbols (init_library, open_database,
/// close_database, enable_console_messages) that plugins cannot link. They are
/// kept in their own translation unit so the plugin never pulls them in.

#include "detail/sdk_bridge.hpp"
#include <idalib.hpp>

#include <abix/session.hpp>
#include <abix/diagnostics.hpp>

#include <chrono>
#include <filesystem>
#include <system_error>

namespace abix::session {

namespace {

namespace fs = std::filesystem;

/// Point IDAUSR at a copy of the user directory without its plugins folder.
Status hide_user_plugins() {
#ifdef _WIN32
    return std::unexpected(Error::unsupported(
        "Disabling user plugins is not implemented on Windows"));
#else
    fs::path source_user_dir;
    qstring idausr;
    if (qgetenv("IDAUSR", &idausr) && !idausr.empty()) {
        source_user_dir = fs::path(abix::detail::to_string(idausr));
    } else {
        qstring home;
        if (qgetenv("HOME", &home) && !home.empty())
            source_user_dir = fs::path(abix::detail::to_string(home)) / ".idapro";
    }

    std::error_code ec;
    fs::path tmp_base = fs::temp_directory_path(ec);
    if (ec || tmp_base.empty()) {
        ec.clear();
        tmp_base = fs::path("/tmp");
    }

    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path sandbox_user = tmp_base / ("abix_idausr_" + std::to_string(now));
    fs::create_directories(sandbox_user, ec);
    if (ec) {
        return std::unexpected(Error::sdk("Failed to create IDAUSR sandbox",
                                          sandbox_user.string() + ": " + ec.message()));
    }

    if (!source_user_dir.empty() && fs::is_directory(source_user_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(source_user_dir, ec)) {
            if (entry.path().filename() == "plugins")
                continue;
            fs::path target = sandbox_user / entry.path().filename();
            if (entry.is_directory())
                fs::create_directory_symlink(entry.path(), target, ec);
            else
                fs::create_symlink(entry.path(), target, ec);
            if (ec) {
                return std::unexpected(Error::sdk("Failed to mirror IDAUSR entry",
                                                  target.string() + ": " + ec.message()));
            }
        }
        if (ec) {
            return std::unexpected(Error::sdk("Failed to enumerate IDAUSR",
                                              source_user_dir.string() + ": " + ec.message()));
        }
    }

    std::string value = sandbox_user.string();
    if (!qsetenv("IDAUSR", value.c_str()))
        return std::unexpected(Error::sdk("qsetenv failed", "IDAUSR=" + value));
    return abix::ok();
#endif
}

} // namespace

Session::~Session() {
    if (is_open_)
        close_database(false);
}

Status Session::open(std::string_view path, const SessionOptions& options) {
    if (is_open_)
        return std::unexpected(Error::validation("Session is already open"));
    if (path.empty())
        return std::unexpected(Error::validation("Database path cannot be empty"));

    if (!options.load_user_plugins) {
        if (auto hidden = hide_user_plugins(); !hidden)
            return std::unexpected(hidden.error());
    }

    int rc = init_library(0, nullptr);
    if (rc != 0)
        return std::unexpected(Error::sdk("init_library failed",
                                          "return code: " + std::to_string(rc)));
    if (options.quiet)
        enable_console_messages(false);

    qstring qpath = abix::detail::to_qstring(path);
    rc = open_database(qpath.c_str(), options.auto_analysis);
    if (rc != 0)
        return std::unexpected(Error::sdk("open_database failed", std::string(path)));
    is_open_ = true;

    if (!auto_wait())
        return std::unexpected(Error::sdk("auto_wait failed or was cancelled"));

    diagnostics::log(diagnostics::LogLevel::Info, "session",
                     "opened " + std::string(path));
    return abix::ok();
}

} // namespace abix::session
