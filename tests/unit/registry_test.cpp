/// \file registry_test.cpp
/// \brief Pair storage, category selection, and the registry text format.

#include <abix/registry.hpp>

#include "../test_harness.hpp"

#include <string>
#include <vector>

namespace {

using abix::ErrorCategory;
using abix::registry::Registry;

void test_append_and_order() {
    SECTION("append keeps insertion order");

    Registry reg;
    CHECK(reg.empty());
    CHECK_OK(reg.add("b::A", "A", "first"));
    CHECK_OK(reg.add("b::B", "B"));
    CHECK_OK(reg.add({"b::C", "C", "second"}));
    CHECK_EQ(reg.size(), 3u);
    CHECK_EQ(reg.pairs()[0].binding, std::string("b::A"));
    CHECK_EQ(reg.pairs()[1].native, std::string("B"));
    CHECK(reg.pairs()[1].category.empty());
    CHECK_EQ(reg.pairs()[2].category, std::string("second"));

    CHECK_ERR(reg.add("", "A"), ErrorCategory::Validation);
    CHECK_ERR(reg.add("b::A", ""), ErrorCategory::Validation);
    CHECK_EQ(reg.size(), 3u);
}

void test_categories_and_select() {
    SECTION("categories and selection");

    Registry reg;
    CHECK_OK(reg.add("b::D1", "D1", "decoder"));
    CHECK_OK(reg.add("b::E1", "E1", "encoder"));
    CHECK_OK(reg.add("b::D2", "D2", "decoder"));
    CHECK_OK(reg.add("b::U", "U"));

    CHECK(reg.categories() == (std::vector<std::string>{"decoder", "encoder"}));

    CHECK_VAL(reg.select({}), _v.size() == 4);
    CHECK_VAL(reg.select({"decoder"}),
              _v.size() == 2 && _v.pairs()[0].binding == "b::D1"
                  && _v.pairs()[1].binding == "b::D2");
    CHECK_ERR(reg.select({"formatter"}), ErrorCategory::Validation);
    CHECK_EQ(reg.size(), 4u);
}

void test_parse_format() {
    SECTION("text format");

    const char* text =
        "# comment\n"
        "\n"
        "untagged::T = T\n"
        "[decoder]\n"
        "  zydis::decoder::Decoder   =   ZydisDecoder  \r\n"
        "zydis::ffi::encoder::OperandRegister = ((ZydisEncoderOperand*)(0))->reg\n"
        "[ zycore ]\n"
        "zydis::ffi::zycore::ZyanVector = ZyanVector";

    auto parsed = abix::registry::parse(text);
    CHECK_OK(parsed);
    if (parsed) {
        CHECK_EQ(parsed->size(), 4u);
        CHECK(parsed->pairs()[0].category.empty());
        CHECK_EQ(parsed->pairs()[1].binding, std::string("zydis::decoder::Decoder"));
        CHECK_EQ(parsed->pairs()[1].native, std::string("ZydisDecoder"));
        CHECK_EQ(parsed->pairs()[1].category, std::string("decoder"));
        CHECK_EQ(parsed->pairs()[2].native, std::string("((ZydisEncoderOperand*)(0))->reg"));
        CHECK_EQ(parsed->pairs()[3].category, std::string("zycore"));
    }

    CHECK_VAL(abix::registry::parse(""), _v.empty());
    CHECK_ERR(abix::registry::parse("[decoder\nA = B\n"), ErrorCategory::Validation);
    CHECK_VAL(abix::registry::parse("[a]\nA = A\n[]\nU = U\n"),
              _v.size() == 2 && _v.pairs()[0].category == "a"
                  && _v.pairs()[1].category.empty());
    CHECK_ERR(abix::registry::parse("A B\n"), ErrorCategory::Validation);
    CHECK_ERR(abix::registry::parse("A =\n"), ErrorCategory::Validation);

    auto bad = abix::registry::parse("A = B\n\n = C\n");
    CHECK(!bad.has_value());
    if (!bad)
        CHECK_CONTAINS(bad.error().context, "line 3");
}

void test_serialize() {
    SECTION("serialize");

    Registry reg;
    CHECK_OK(reg.add("b::D1", "D1", "decoder"));
    CHECK_OK(reg.add("b::D2", "((Op*)(0))->reg", "decoder"));
    CHECK_OK(reg.add("b::Z", "Z", "zycore"));

    std::string text = abix::registry::serialize(reg);
    CHECK_EQ(text, std::string("[decoder]\n"
                               "b::D1 = D1\n"
                               "b::D2 = ((Op*)(0))->reg\n"
                               "\n"
                               "[zycore]\n"
                               "b::Z = Z\n"));

    auto reparsed = abix::registry::parse(text);
    CHECK_VAL(reparsed, _v.size() == 3 && _v.pairs()[1].native == "((Op*)(0))->reg"
                            && _v.pairs()[2].category == "zycore");
}

void test_serialize_mixed_tags() {
    SECTION("serialize keeps untagged pairs untagged");

    Registry reg;
    CHECK_OK(reg.add("b::A", "A", "decoder"));
    CHECK_OK(reg.add("b::U", "U"));
    CHECK_OK(reg.add("b::E", "E", "encoder"));

    std::string text = abix::registry::serialize(reg);
    CHECK_EQ(text, std::string("[decoder]\n"
                               "b::A = A\n"
                               "\n"
                               "[]\n"
                               "b::U = U\n"
                               "\n"
                               "[encoder]\n"
                               "b::E = E\n"));

    auto reparsed = abix::registry::parse(text);
    CHECK_OK(reparsed);
    if (!reparsed)
        return;
    CHECK_EQ(reparsed->size(), reg.size());
    for (std::size_t i = 0; i < reg.size() && i < reparsed->size(); ++i) {
        CHECK_EQ(reparsed->pairs()[i].binding, reg.pairs()[i].binding);
        CHECK_EQ(reparsed->pairs()[i].native, reg.pairs()[i].native);
        CHECK_EQ(reparsed->pairs()[i].category, reg.pairs()[i].category);
    }
    CHECK_VAL(reparsed->select({"decoder"}), _v.size() == 1);
    CHECK_VAL(reg.select({"decoder"}), _v.size() == 1);

    Registry untagged_first;
    CHECK_OK(untagged_first.add("b::U", "U"));
    CHECK_OK(untagged_first.add("b::A", "A", "decoder"));
    CHECK_EQ(abix::registry::serialize(untagged_first),
             std::string("b::U = U\n\n[decoder]\nb::A = A\n"));
}

void test_split_categories() {
    SECTION("comma-separated category lists");

    using abix::registry::split_categories;
    CHECK(split_categories("").empty());
    CHECK(split_categories(" , ,").empty());
    CHECK(split_categories("decoder") == (std::vector<std::string>{"decoder"}));
    CHECK(split_categories(" decoder, encoder ,,zycore ")
          == (std::vector<std::string>{"decoder", "encoder", "zycore"}));
}

void test_builtin() {
    SECTION("built-in registry");

    const Registry& reg = abix::registry::builtin();
    CHECK_EQ(reg.size(), 21u);
    CHECK(reg.categories()
          == (std::vector<std::string>{"decoder", "encoder", "formatter", "zycore"}));
    CHECK_EQ(reg.pairs().front().binding, std::string("zydis::decoder::Decoder"));
    CHECK_EQ(reg.pairs().front().native, std::string("ZydisDecoder"));
    CHECK_EQ(reg.pairs()[12].native, std::string("((ZydisEncoderOperand*)(0))->reg"));
    CHECK_EQ(reg.pairs().back().native, std::string("ZyanString"));
    CHECK_VAL(reg.select({"formatter"}), _v.size() == 2);
}

void test_load() {
    SECTION("load");

    CHECK_ERR(abix::registry::load("/nonexistent/abix/registry.abix"),
              ErrorCategory::NotFound);

    auto shipped = abix::registry::load(ABIX_SOURCE_DIR "/registry/zydis.abix");
    CHECK_OK(shipped);
    if (shipped) {
        const Registry& builtin = abix::registry::builtin();
        CHECK_EQ(shipped->size(), builtin.size());
        bool same = shipped->size() == builtin.size();
        for (std::size_t i = 0; same && i < builtin.size(); ++i) {
            const auto& a = shipped->pairs()[i];
            const auto& b = builtin.pairs()[i];
            same = a.binding == b.binding && a.native == b.native && a.category == b.category;
        }
        CHECK(same);
    }
}

} // namespace

int main() {
    test_append_and_order();
    test_categories_and_select();
    test_parse_format();
    test_serialize();
    test_serialize_mixed_tags();
    test_split_categories();
    test_builtin();
    test_load();
    return abix_test::report("abix registry tests");
}
