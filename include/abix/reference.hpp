/// \file reference.hpp
/// \brief Type references, dialects, and the reference parser.
///
/// A type reference is the textual name of a type as the session knows it.
/// Its syntax depends on the dialect of the declaring side:
///
/// - Dialect::Native: C spellings. Tag or typedef names (`ZydisDecoder`,
///   `struct ZyanVector`), multi-word builtins (`unsigned int`), and
///   trailing `*` for pointers. `<`, `>` and `::` are rejected: a C parser
///   reads them as operators.
/// - Dialect::Binding: namespace-qualified names with balanced generic
///   arguments (`zydis::ffi::decoder::AccessedFlags<zydis::enums::CpuFlag>`).
///
/// Both dialects accept the field-access form `((T*)(0))->member[.member]`,
/// which denotes the type of a member of `T` (used where one side only
/// exposes a union flavour as a nested member).

#ifndef ABIX_REFERENCE_HPP
#define ABIX_REFERENCE_HPP

#include <abix/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace abix {

/// Syntax ruleset applied when interpreting a reference string.
enum class Dialect {
    Native,
    Binding,
};

/// "native" or "binding".
std::string_view dialect_name(Dialect dialect);

} // namespace abix

namespace abix::reference {

enum class ReferenceKind {
    TypeName,     ///< A plain type spelling.
    FieldAccess,  ///< `((T*)(0))->a.b`: the type of member a.b of T.
};

/// A reference split into the parts the oracle resolves.
struct ParsedReference {
    ReferenceKind            kind{ReferenceKind::TypeName};
    Dialect                  dialect{Dialect::Native};
    std::string              text;         ///< Original reference, untouched.
    std::string              type_name;    ///< Normalised type spelling.
    std::vector<std::string> member_path;  ///< Empty for TypeName.
};

/// Parse \p text in \p dialect.
/// Errors are ErrorCategory::Validation with the reference and dialect as context.
Result<ParsedReference> parse(std::string_view text, Dialect dialect);

/// Canonical spelling of a type name: whitespace collapsed, no blanks around
/// `::`, `<`, `>` or `*`, and exactly one blank after each `,`.
std::string normalize_type_name(std::string_view name);

/// True for a non-empty [A-Za-z_$][A-Za-z0-9_$]* string.
bool is_identifier(std::string_view text);

/// Tag keyword a native spelling starts with ("struct", "union", "enum"),
/// or empty when there is none.
std::string_view tag_keyword(std::string_view type_name);

/// \p type_name without its leading tag keyword.
std::string_view strip_tag_keyword(std::string_view type_name);

} // namespace abix::reference

#endif // ABIX_REFERENCE_HPP
