/// \file core.hpp
/// \brief Shared option structs used across abix entry points.

#ifndef ABIX_CORE_HPP
#define ABIX_CORE_HPP

#include <string>
#include <vector>

namespace abix {

/// Printed as the last line of a run in which every pair passed.
inline constexpr const char* kDefaultSentinel = "ALL STRUCTS OK";

/// Options controlling a conformance run and its report.
struct RunOptions {
    std::string success_sentinel{kDefaultSentinel};
    bool report_passes{false};          ///< Emit a line for passing pairs too.
    std::vector<std::string> categories; ///< Empty means every category.
};

} // namespace abix

#endif // ABIX_CORE_HPP
