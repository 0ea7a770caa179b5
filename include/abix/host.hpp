/// \file host.hpp
/// \brief The IDA-hosted Layout Oracle and host output.
///
/// Everything here talks to the database that is currently loaded, whether
/// IDA opened it interactively or idalib opened it headless (see
/// session.hpp). The oracle never opens, closes, or writes to that database:
/// dialect activation only checks that the database can answer (a local type
/// library, and a configured compiler for the native dialect).

#ifndef ABIX_HOST_HPP
#define ABIX_HOST_HPP

#include <abix/conformance.hpp>
#include <abix/error.hpp>
#include <abix/oracle.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace abix::host {

/// Layout oracle over the local type library of the current database.
///
/// Debug information (DWARF or PDB) imported by IDA lands in that library
/// under its source-level names, so both `ZydisDecoder` and
/// `zydis::decoder::Decoder` are looked up verbatim. Trailing `*` wraps the
/// found type in pointers. Native spellings that are not library names
/// (`unsigned int`) go through the session's declaration parser.
class SessionOracle final : public oracle::LayoutOracle {
public:
    SessionOracle() = default;

    [[nodiscard]] std::string describe() const override;

protected:
    Status activate_dialect(Dialect dialect) override;
    Result<std::uint64_t> resolve_size(const reference::ParsedReference& ref) override;
};

/// Path of the binary the database was created from.
Result<std::string> input_file_path();

/// True while the debugger has a live process.
bool process_attached();

/// Print one line to the IDA output window.
void message(std::string_view line);

/// A conformance::LineSink that prints to the IDA output window.
conformance::LineSink output_sink();

} // namespace abix::host

#endif // ABIX_HOST_HPP
