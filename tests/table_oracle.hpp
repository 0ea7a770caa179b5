/// \file table_oracle.hpp
/// \brief In-memory LayoutOracle for tests: sizes come from literal tables.
///
/// Keys are normalised type names; field accesses are keyed as
/// `Type->member.sub`. Counts dialect activations so tests can verify they
/// happen once per session.

#ifndef ABIX_TEST_TABLE_ORACLE_HPP
#define ABIX_TEST_TABLE_ORACLE_HPP

#include <abix/oracle.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace abix_test {

using SizeTable = std::map<std::string, std::uint64_t>;

class TableOracle final : public abix::oracle::LayoutOracle {
public:
    TableOracle(SizeTable binding, SizeTable native)
        : binding_(std::move(binding)), native_(std::move(native)) {}

    std::string describe() const override { return "table oracle"; }

    int activations(abix::Dialect dialect) const {
        return dialect == abix::Dialect::Native ? native_activations_ : binding_activations_;
    }

    int lookups() const { return lookups_; }

    /// Make activation of \p dialect fail.
    void fail_activation(abix::Dialect dialect) {
        (dialect == abix::Dialect::Native ? fail_native_ : fail_binding_) = true;
    }

protected:
    abix::Status activate_dialect(abix::Dialect dialect) override {
        if (dialect == abix::Dialect::Native) {
            ++native_activations_;
            if (fail_native_)
                return std::unexpected(abix::Error::sdk("native parser unavailable"));
        } else {
            ++binding_activations_;
            if (fail_binding_)
                return std::unexpected(abix::Error::sdk("binding parser unavailable"));
        }
        return abix::ok();
    }

    abix::Result<std::uint64_t> resolve_size(
            const abix::reference::ParsedReference& ref) override {
        ++lookups_;
        std::string key = ref.type_name;
        for (std::size_t i = 0; i < ref.member_path.size(); ++i)
            key += (i == 0 ? "->" : ".") + ref.member_path[i];

        const SizeTable& table = ref.dialect == abix::Dialect::Native ? native_ : binding_;
        auto it = table.find(key);
        if (it == table.end())
            return std::unexpected(abix::Error::not_found("No such type", key));
        return it->second;
    }

private:
    SizeTable binding_;
    SizeTable native_;
    int native_activations_{0};
    int binding_activations_{0};
    int lookups_{0};
    bool fail_native_{false};
    bool fail_binding_{false};
};

} // namespace abix_test

#endif // ABIX_TEST_TABLE_ORACLE_HPP
