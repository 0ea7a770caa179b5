/// \file abix.hpp
/// \brief Master include for abix.
///
/// Brings in the error model, diagnostics, references, the registry, the
/// oracle interface, the conformance driver, and the IDA-hosted oracle.
/// The headless session (session.hpp) and the plugin export helper
/// (plugin.hpp) are included separately by the entry points that need them.

#ifndef ABIX_ABIX_HPP
#define ABIX_ABIX_HPP

#include <abix/error.hpp>
#include <abix/core.hpp>
#include <abix/diagnostics.hpp>
#include <abix/reference.hpp>
#include <abix/registry.hpp>
#include <abix/oracle.hpp>
#include <abix/conformance.hpp>
#include <abix/host.hpp>

#endif // ABIX_ABIX_HPP
