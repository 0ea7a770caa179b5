/// \file registry.cpp
/// \brief Implementation of abix::registry: pair storage and the text format.

#include <abix/registry.hpp>
#include <abix/diagnostics.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace abix::registry {

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view blanks = " \t\r\n";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos)
        return {};
    auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

std::string line_context(std::size_t line_no) {
    return "line " + std::to_string(line_no);
}

} // namespace

Status Registry::add(ConformancePair pair) {
    if (pair.binding.empty())
        return std::unexpected(Error::validation("Binding reference cannot be empty",
                                                 pair.native));
    if (pair.native.empty())
        return std::unexpected(Error::validation("Native reference cannot be empty",
                                                 pair.binding));
    pairs_.push_back(std::move(pair));
    return abix::ok();
}

Status Registry::add(std::string binding, std::string native, std::string category) {
    return add(ConformancePair{std::move(binding), std::move(native), std::move(category)});
}

std::vector<std::string> Registry::categories() const {
    std::vector<std::string> out;
    for (const auto& pair : pairs_) {
        if (pair.category.empty())
            continue;
        if (std::find(out.begin(), out.end(), pair.category) == out.end())
            out.push_back(pair.category);
    }
    return out;
}

Result<Registry> Registry::select(const std::vector<std::string>& wanted) const {
    if (wanted.empty())
        return *this;

    auto known = categories();
    for (const auto& category : wanted) {
        if (std::find(known.begin(), known.end(), category) == known.end())
            return std::unexpected(Error::validation("Unknown category", category));
    }

    Registry out;
    for (const auto& pair : pairs_) {
        if (std::find(wanted.begin(), wanted.end(), pair.category) != wanted.end())
            out.pairs_.push_back(pair);
    }
    return out;
}

Result<Registry> parse(std::string_view text) {
    Registry out;
    std::string category;
    std::size_t line_no = 0;

    while (!text.empty()) {
        ++line_no;
        auto eol = text.find('\n');
        std::string_view line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            if (line.back() != ']')
                return std::unexpected(Error::validation("Unterminated category header",
                                                         line_context(line_no)));
            // `[]` returns to untagged pairs.
            category = std::string(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos)
            return std::unexpected(Error::validation("Expected 'binding = native'",
                                                     line_context(line_no)));

        auto added = out.add(std::string(trim(line.substr(0, eq))),
                             std::string(trim(line.substr(eq + 1))),
                             category);
        if (!added)
            return std::unexpected(diagnostics::enrich(added.error(), line_context(line_no)));
    }
    return out;
}

Result<Registry> load(std::string_view path) {
    std::string path_str(path);
    std::ifstream in(path_str, std::ios::binary);
    if (!in.is_open())
        return std::unexpected(Error::not_found("Cannot open registry file", path_str));

    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto parsed = parse(buffer.str());
    if (!parsed)
        return std::unexpected(diagnostics::enrich(parsed.error(), path_str));

    diagnostics::log(diagnostics::LogLevel::Info, "registry",
                     "loaded " + std::to_string(parsed->size()) + " pairs from " + path_str);
    return parsed;
}

std::vector<std::string> split_categories(std::string_view text) {
    std::vector<std::string> out;
    while (!text.empty()) {
        auto comma = text.find(',');
        std::string_view item = trim(text.substr(0, comma));
        if (!item.empty())
            out.emplace_back(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return out;
}

std::string serialize(const Registry& registry) {
    std::string out;
    std::string category;
    for (const auto& pair : registry.pairs()) {
        if (pair.category != category) {
            if (!out.empty())
                out += "\n";
            out += "[" + pair.category + "]\n";
        }
        category = pair.category;
        out += pair.binding + " = " + pair.native + "\n";
    }
    return out;
}

} // namespace abix::registry
