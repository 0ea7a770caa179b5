/// \file session.hpp
/// \brief Headless (idalib) session lifecycle for batch checking.
///
/// Only the batch tool links this; plugins run inside a session IDA owns.

#ifndef ABIX_SESSION_HPP
#define ABIX_SESSION_HPP

#include <abix/error.hpp>

#include <string_view>

namespace abix::session {

struct SessionOptions {
    bool quiet{true};                 ///< Silence IDA's console messages.
    bool load_user_plugins{true};     ///< Load plugins from IDAUSR.
    bool auto_analysis{true};         ///< Run auto-analysis (imports debug info).
};

/// Owns an idalib database for the lifetime of the object.
class Session {
public:
    Session() = default;
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Initialise idalib, open \p path, and wait for analysis to settle.
    Status open(std::string_view path, const SessionOptions& options = {});

    [[nodiscard]] bool is_open() const noexcept { return is_open_; }

private:
    bool is_open_{false};
};

} // namespace abix::session

#endif // ABIX_SESSION_HPP
