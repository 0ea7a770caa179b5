/// \file host_oracle.cpp
/// \brief Implementation of abix::host: type sizes from the IDA type library.

#include "detail/sdk_bridge.hpp"
#include <abix/host.hpp>
#include <abix/diagnostics.hpp>

namespace abix::host {

namespace {

/// Split `Foo**` into `Foo` and a pointer depth of 2.
std::string_view peel_pointers(std::string_view name, int* depth) {
    *depth = 0;
    while (!name.empty() && (name.back() == '*' || name.back() == ' ')) {
        if (name.back() == '*')
            ++*depth;
        name.remove_suffix(1);
    }
    return name;
}

/// Declaration-parser fallback for C spellings that are not library names.
/// PT_SIL parses without storing anything in the type library.
bool parse_as_declaration(tinfo_t* out, std::string_view spelling) {
    qstring decl = abix::detail::to_qstring(spelling);
    decl.append(" __abix_probe;");
    qstring name;
    return parse_decl(out, &name, nullptr, decl.c_str(), PT_SIL);
}

Result<tinfo_t> lookup_type(const reference::ParsedReference& ref) {
    int depth = 0;
    std::string_view spelling = peel_pointers(ref.type_name, &depth);
    std::string lookup(ref.dialect == Dialect::Native
                           ? reference::strip_tag_keyword(spelling)
                           : spelling);

    tinfo_t tif;
    if (!tif.get_named_type(get_idati(), lookup.c_str(), BTF_TYPEDEF, true, false)
        && (ref.dialect != Dialect::Native || !parse_as_declaration(&tif, spelling))) {
        return std::unexpected(Error::not_found("Type not found in the session's type library",
                                                lookup));
    }

    for (int i = 0; i < depth; ++i) {
        tinfo_t ptr;
        ptr.create_ptr(tif);
        tif = ptr;
    }
    return tif;
}

Result<tinfo_t> member_type(const tinfo_t& base, const std::string& member) {
    if (!base.is_udt())
        return std::unexpected(Error::validation("Member access on a non-aggregate type",
                                                 member));

    udm_t udm;
    udm.name = abix::detail::to_qstring(member);
    if (base.find_udm(&udm, STRMEM_NAME) < 0)
        return std::unexpected(Error::not_found("Member not found", member));
    if (udm.is_bitfield())
        return std::unexpected(Error::unsupported("Bitfield member has no byte size", member));
    return udm.type;
}

} // namespace

std::string SessionOracle::describe() const {
    std::string out = "IDA database";
    if (auto path = input_file_path(); path && !path->empty())
        out += " for " + *path;
    if (process_attached())
        out += " (process attached)";
    return out;
}

Status SessionOracle::activate_dialect(Dialect dialect) {
    // Read-only: the compiler and parser selection belong to the database.
    if (get_idati() == nullptr)
        return std::unexpected(Error::sdk("The database has no local type library"));

    switch (dialect) {
        case Dialect::Binding:
            return abix::ok();
        case Dialect::Native:
            if (inf_get_cc_id() == COMP_UNK)
                return std::unexpected(Error::configuration(
                    "The database has no compiler configured",
                    "select one under Options > Compiler"));
            return abix::ok();
    }
    return std::unexpected(Error::internal("Unknown dialect"));
}

Result<std::uint64_t> SessionOracle::resolve_size(const reference::ParsedReference& ref) {
    auto tif = lookup_type(ref);
    if (!tif)
        return std::unexpected(tif.error());

    tinfo_t current = *tif;
    for (const auto& member : ref.member_path) {
        auto next = member_type(current, member);
        if (!next)
            return std::unexpected(diagnostics::enrich(next.error(), "in " + ref.type_name));
        current = *next;
    }

    if (current.is_forward_decl())
        return std::unexpected(Error::not_found("Type is only forward-declared", ref.type_name));

    size_t size = current.get_size();
    if (size == BADSIZE)
        return std::unexpected(Error::sdk("Cannot determine type size", ref.type_name));
    return static_cast<std::uint64_t>(size);
}

Result<std::string> input_file_path() {
    char buffer[QMAXPATH];
    ssize_t length = get_input_file_path(buffer, sizeof(buffer));
    if (length <= 0)
        return std::unexpected(Error::not_found("No input file path recorded"));
    return std::string(buffer, static_cast<std::size_t>(length));
}

bool process_attached() {
    return get_process_state() != DSTATE_NOTASK;
}

void message(std::string_view line) {
    // msg() is printf-style; the line is never the format.
    ::msg("%.*s\n", static_cast<int>(line.size()), line.data());
}

conformance::LineSink output_sink() {
    return [](std::string_view line) { message(line); };
}

} // namespace abix::host
