/// \file registry.hpp
/// \brief The ordered, append-only list of (binding, native) conformance pairs.
///
/// Text format (one declaration per line):
///
///     # comment
///     [decoder]
///     zydis::decoder::Decoder = ZydisDecoder
///
/// A `[category]` line tags every following pair until the next one; `[]`
/// goes back to untagged pairs. A pair
/// line is split at its first `=`; both sides are trimmed and must be
/// non-empty.

#ifndef ABIX_REGISTRY_HPP
#define ABIX_REGISTRY_HPP

#include <abix/error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace abix::registry {

/// The claim "these two types must have identical size".
struct ConformancePair {
    std::string binding;   ///< Reference in Dialect::Binding.
    std::string native;    ///< Reference in Dialect::Native.
    std::string category;  ///< Optional grouping tag, for reporting only.
};

/// Append-only sequence of pairs. Order is insertion order.
class Registry {
public:
    Registry() = default;

    /// Append a pair. Both references must be non-empty.
    Status add(ConformancePair pair);
    Status add(std::string binding, std::string native, std::string category = {});

    [[nodiscard]] const std::vector<ConformancePair>& pairs() const noexcept { return pairs_; }
    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }

    /// Distinct categories in first-seen order. Untagged pairs are not listed.
    [[nodiscard]] std::vector<std::string> categories() const;

    /// A new registry holding only the pairs tagged with one of \p categories.
    /// An empty list selects everything; an unknown category is a Validation error.
    [[nodiscard]] Result<Registry> select(const std::vector<std::string>& categories) const;

private:
    std::vector<ConformancePair> pairs_;
};

/// Parse the text format.
Result<Registry> parse(std::string_view text);

/// Read and parse a registry file.
Result<Registry> load(std::string_view path);

/// Render \p registry in the text format accepted by parse().
std::string serialize(const Registry& registry);

/// Split a comma-separated category list; blank items are dropped.
std::vector<std::string> split_categories(std::string_view text);

/// The reference pair list for the Zydis Rust binding.
const Registry& builtin();

} // namespace abix::registry

#endif // ABIX_REGISTRY_HPP
