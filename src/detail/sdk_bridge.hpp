/// \file sdk_bridge.hpp
/// \brief Internal adapter utilities between abix public types and the IDA SDK.
///
/// This header is PRIVATE to abix. It must never be included from public headers.
/// It pulls in SDK headers and provides conversion helpers.

#ifndef ABIX_DETAIL_SDK_BRIDGE_HPP
#define ABIX_DETAIL_SDK_BRIDGE_HPP

// ── C++20/23 compatibility shim ─────────────────────────────────────────
// The IDA SDK (pro.h) uses std::is_pod<T> without including <type_traits>.
// Ensure the header is included before pro.h so std::is_pod is visible.
#include <functional>
#include <locale>
#include <vector>
#include <type_traits>

// ── IDA SDK headers ─────────────────────────────────────────────────────
// Order matters: pro.h must come first.
#include <pro.h>
#include <ida.hpp>
#include <idp.hpp>
#include <auto.hpp>
#include <dbg.hpp>
#include <kernwin.hpp>
#include <loader.hpp>
#include <nalt.hpp>
#include <typeinf.hpp>

#include <abix/error.hpp>

#include <string>
#include <string_view>

namespace abix::detail {

/// Convert qstring to std::string.
inline std::string to_string(const qstring& qs) {
    return std::string(qs.c_str(), qs.length());
}

/// Convert std::string_view to a temporary qstring.
inline qstring to_qstring(std::string_view sv) {
    return qstring(sv.data(), sv.size());
}

} // namespace abix::detail

#endif // ABIX_DETAIL_SDK_BRIDGE_HPP
