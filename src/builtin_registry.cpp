/// \file builtin_registry.cpp
/// \brief The built-in Zydis binding pair list (mirrors registry/zydis.abix).

#include <abix/registry.hpp>
#include <abix/diagnostics.hpp>

namespace abix::registry {

namespace {

struct BuiltinPair {
    const char* binding;
    const char* native;
    const char* category;
};

constexpr BuiltinPair kZydisPairs[] = {
    {"zydis::decoder::Decoder",                                    "ZydisDecoder",                    "decoder"},
    {"zydis::ffi::decoder::AccessedFlags<zydis::enums::CpuFlag>",  "ZydisAccessedFlags",              "decoder"},
    {"zydis::ffi::decoder::AccessedFlags<zydis::enums::FpuFlag>",  "ZydisAccessedFlags",              "decoder"},
    {"zydis::ffi::decoder::AvxInfo",                               "ZydisDecodedInstructionAvx",      "decoder"},
    {"zydis::ffi::decoder::MetaInfo",                              "ZydisDecodedInstructionMeta",     "decoder"},
    {"zydis::ffi::decoder::RawInfo",                               "ZydisDecodedInstructionRaw",      "decoder"},
    {"zydis::ffi::decoder::MemoryInfo",                            "ZydisDecodedOperandMem",          "decoder"},
    {"zydis::ffi::decoder::PointerInfo",                           "ZydisDecodedOperandPtr",          "decoder"},
    {"zydis::enums::generated::Register",                          "ZydisDecodedOperandReg",          "decoder"},
    {"zydis::ffi::decoder::ImmediateInfo",                         "ZydisDecodedOperandImm",          "decoder"},
    {"zydis::ffi::decoder::DecodedOperand",                        "ZydisDecodedOperand",             "decoder"},
    {"zydis::ffi::decoder::DecoderContext",                        "ZydisDecoderContext",             "decoder"},

    {"zydis::ffi::encoder::OperandRegister",  "((ZydisEncoderOperand*)(0))->reg",  "encoder"},
    {"zydis::ffi::encoder::OperandPointer",   "((ZydisEncoderOperand*)(0))->ptr",  "encoder"},
    {"zydis::ffi::encoder::OperandMemory",    "((ZydisEncoderOperand*)(0))->mem",  "encoder"},
    {"zydis::ffi::encoder::EncoderOperand",   "ZydisEncoderOperand",               "encoder"},
    {"zydis::ffi::encoder::EncoderRequest",   "ZydisEncoderRequest",               "encoder"},

    {"zydis::ffi::formatter::Formatter",        "ZydisFormatter",        "formatter"},
    {"zydis::ffi::formatter::FormatterBuffer",  "ZydisFormatterBuffer",  "formatter"},

    {"zydis::ffi::zycore::ZyanVector",  "ZyanVector",  "zycore"},
    {"zydis::ffi::zycore::ZyanString",  "ZyanString",  "zycore"},
};

Registry make_builtin() {
    Registry out;
    for (const auto& entry : kZydisPairs) {
        auto added = out.add(entry.binding, entry.native, entry.category);
        if (!added) {
            diagnostics::log(diagnostics::LogLevel::Error, "registry",
                             "built-in pair rejected: " + error_text(added.error()));
        }
    }
    return out;
}

} // namespace

const Registry& builtin() {
    static const Registry registry = make_builtin();
    return registry;
}

} // namespace abix::registry
