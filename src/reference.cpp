/// \file reference.cpp
/// \brief Implementation of abix::reference: dialect-aware reference parsing.

#include <abix/reference.hpp>

#include <cctype>

namespace abix {

std::string_view dialect_name(Dialect dialect) {
    switch (dialect) {
        case Dialect::Native:  return "native";
        case Dialect::Binding: return "binding";
    }
    return "unknown";
}

} // namespace abix

namespace abix::reference {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && is_space(text.back()))
        text.remove_suffix(1);
    return text;
}

std::string reference_context(std::string_view text, Dialect dialect) {
    return "'" + std::string(text) + "' in " + std::string(dialect_name(dialect))
         + " dialect";
}

Error syntax_error(std::string msg, std::string_view text, Dialect dialect) {
    return Error::validation(std::move(msg), reference_context(text, dialect));
}

/// Native spellings: words and trailing '*', nothing a C parser treats as an operator.
Status validate_native(std::string_view name, std::string_view text) {
    bool seen_word = false;
    bool seen_star = false;
    std::size_t i = 0;
    while (i < name.size()) {
        char c = name[i];
        if (is_space(c)) {
            ++i;
            continue;
        }
        if (c == '<' || c == '>' || c == ':') {
            return std::unexpected(syntax_error(
                "Reference uses syntax the native dialect parses as operators",
                text, Dialect::Native));
        }
        if (c == '*') {
            if (!seen_word)
                return std::unexpected(syntax_error("Pointer without a pointee type",
                                                    text, Dialect::Native));
            seen_star = true;
            ++i;
            continue;
        }
        if (!is_ident_start(c) || seen_star) {
            return std::unexpected(syntax_error("Unexpected character in type name",
                                                text, Dialect::Native));
        }
        while (i < name.size() && is_ident_char(name[i]))
            ++i;
        seen_word = true;
    }
    if (!seen_word)
        return std::unexpected(syntax_error("Empty type name", text, Dialect::Native));
    return abix::ok();
}

/// Binding spellings: `seg(::seg)*` where a segment may carry `<...>` arguments.
Status validate_binding(std::string_view name, std::string_view text) {
    int depth = 0;
    bool expect_segment = true;
    std::size_t i = 0;
    while (i < name.size()) {
        char c = name[i];
        if (is_space(c)) {
            ++i;
            continue;
        }
        if (depth == 0) {
            if (expect_segment) {
                if (!is_ident_start(c)) {
                    return std::unexpected(syntax_error(
                        "Expected an identifier", text, Dialect::Binding));
                }
                while (i < name.size() && is_ident_char(name[i]))
                    ++i;
                expect_segment = false;
                continue;
            }
            if (name.substr(i, 2) == "::") {
                expect_segment = true;
                i += 2;
                continue;
            }
            if (c == '<') {
                ++depth;
                ++i;
                continue;
            }
            if (c == '*') {
                ++i;
                continue;
            }
            return std::unexpected(syntax_error("Unexpected character in type name",
                                                text, Dialect::Binding));
        }
        // Inside generic arguments anything goes as long as brackets balance.
        if (c == '<')
            ++depth;
        else if (c == '>')
            --depth;
        ++i;
    }
    if (depth != 0)
        return std::unexpected(syntax_error("Unbalanced generic arguments",
                                            text, Dialect::Binding));
    if (expect_segment)
        return std::unexpected(syntax_error("Type name ends with '::'",
                                            text, Dialect::Binding));
    return abix::ok();
}

Status validate_type_name(std::string_view name, std::string_view text, Dialect dialect) {
    if (trim(name).empty())
        return std::unexpected(syntax_error("Empty type name", text, dialect));
    return dialect == Dialect::Native ? validate_native(name, text)
                                      : validate_binding(name, text);
}

/// Position of the `*` closing the cast in `((T*)...`, skipping generic arguments.
std::size_t find_cast_star(std::string_view body) {
    int depth = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (c == '*' && depth == 0) {
            std::size_t j = i + 1;
            while (j < body.size() && is_space(body[j]))
                ++j;
            if (j < body.size() && body[j] == ')')
                return i;
        }
    }
    return std::string_view::npos;
}

class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    void skip_space() {
        while (pos_ < text_.size() && is_space(text_[pos_]))
            ++pos_;
    }

    bool consume(std::string_view token) {
        skip_space();
        if (text_.substr(pos_, token.size()) != token)
            return false;
        pos_ += token.size();
        return true;
    }

    std::string identifier() {
        skip_space();
        std::size_t start = pos_;
        if (pos_ < text_.size() && is_ident_start(text_[pos_])) {
            while (pos_ < text_.size() && is_ident_char(text_[pos_]))
                ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    bool at_end() {
        skip_space();
        return pos_ >= text_.size();
    }

    std::size_t pos() const { return pos_; }
    void advance(std::size_t n) { pos_ += n; }
    std::string_view rest() const { return text_.substr(pos_); }

private:
    std::string_view text_;
    std::size_t pos_{0};
};

Result<ParsedReference> parse_field_access(std::string_view text, Dialect dialect) {
    Cursor cur(text);
    if (!cur.consume("(") || !cur.consume("("))
        return std::unexpected(syntax_error("Expected '((' opening a field access",
                                            text, dialect));

    std::string_view body = cur.rest();
    std::size_t star = find_cast_star(body);
    if (star == std::string_view::npos)
        return std::unexpected(syntax_error("Expected a pointer cast '(T*)'", text, dialect));

    std::string_view type_text = trim(body.substr(0, star));
    if (auto valid = validate_type_name(type_text, text, dialect); !valid)
        return std::unexpected(valid.error());
    cur.advance(star + 1);

    if (!cur.consume(")"))
        return std::unexpected(syntax_error("Expected ')' after the cast type", text, dialect));

    // The null base is spelled `(0)` or `0`.
    bool parenthesized = cur.consume("(");
    if (!cur.consume("0"))
        return std::unexpected(syntax_error("Field access must be based on a null pointer",
                                            text, dialect));
    if (parenthesized && !cur.consume(")"))
        return std::unexpected(syntax_error("Unbalanced parentheses", text, dialect));
    if (!cur.consume(")"))
        return std::unexpected(syntax_error("Unbalanced parentheses", text, dialect));
    if (!cur.consume("->"))
        return std::unexpected(syntax_error("Expected '->' after the cast", text, dialect));

    ParsedReference out;
    out.kind = ReferenceKind::FieldAccess;
    out.dialect = dialect;
    out.text = std::string(text);
    out.type_name = normalize_type_name(type_text);

    do {
        std::string member = cur.identifier();
        if (member.empty())
            return std::unexpected(syntax_error("Expected a member name", text, dialect));
        out.member_path.push_back(std::move(member));
    } while (cur.consume("."));

    if (!cur.at_end())
        return std::unexpected(syntax_error("Trailing characters after member path",
                                            text, dialect));
    return out;
}

} // namespace

bool is_identifier(std::string_view text) {
    if (text.empty() || !is_ident_start(text.front()))
        return false;
    for (char c : text) {
        if (!is_ident_char(c))
            return false;
    }
    return true;
}

std::string normalize_type_name(std::string_view name) {
    auto glues = [](char c) {
        return c == ':' || c == '<' || c == '>' || c == ',' || c == '*';
    };

    std::string out;
    out.reserve(name.size());
    bool pending_space = false;
    for (char c : trim(name)) {
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty() && out.back() != ' '
            && !glues(out.back()) && !glues(c))
            out.push_back(' ');
        if (out.size() >= 2 && out.back() == ' ' && out[out.size() - 2] == ','
            && (c == '>' || c == ','))
            out.pop_back();
        pending_space = false;
        out.push_back(c);
        if (c == ',')
            out.push_back(' ');
    }
    while (!out.empty() && out.back() == ' ')
        out.pop_back();
    return out;
}

std::string_view tag_keyword(std::string_view type_name) {
    type_name = trim(type_name);
    for (std::string_view keyword : {"struct", "union", "enum"}) {
        if (type_name.size() > keyword.size()
            && type_name.substr(0, keyword.size()) == keyword
            && is_space(type_name[keyword.size()])) {
            return keyword;
        }
    }
    return {};
}

std::string_view strip_tag_keyword(std::string_view type_name) {
    type_name = trim(type_name);
    std::string_view keyword = tag_keyword(type_name);
    if (keyword.empty())
        return type_name;
    return trim(type_name.substr(keyword.size()));
}

Result<ParsedReference> parse(std::string_view text, Dialect dialect) {
    std::string_view trimmed = trim(text);
    if (trimmed.empty())
        return std::unexpected(syntax_error("Empty type reference", text, dialect));

    if (trimmed.front() == '(')
        return parse_field_access(text, dialect);

    if (auto valid = validate_type_name(trimmed, text, dialect); !valid)
        return std::unexpected(valid.error());

    ParsedReference out;
    out.kind = ReferenceKind::TypeName;
    out.dialect = dialect;
    out.text = std::string(text);
    out.type_name = normalize_type_name(trimmed);
    return out;
}

} // namespace abix::reference
