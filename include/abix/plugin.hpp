/// \file plugin.hpp
/// \brief Plugin lifecycle and the ABIX_PLUGIN() export helper.
///
/// Subclass `abix::plugin::Plugin`, override `info()` and `run()`, and place
/// `ABIX_PLUGIN(MyPlugin)` at file scope in exactly one .cpp file. The
/// export block (`plugin_t PLUGIN`) lives in src/plugin.cpp, which only the
/// plugin module links.

#ifndef ABIX_PLUGIN_HPP
#define ABIX_PLUGIN_HPP

#include <abix/error.hpp>

#include <cstddef>
#include <string>
#include <type_traits>

namespace abix::plugin {

/// Info descriptor returned by Plugin::info().
struct Info {
    std::string name;       ///< Short name shown in menus.
    std::string hotkey;     ///< Hotkey trigger (e.g. "Ctrl-Alt-L").
    std::string comment;    ///< Status-bar / tooltip text.
    std::string help;       ///< Extended help text.
};

/// Base class for PLUGIN_MULTI-style plugins.
class Plugin {
public:
    virtual ~Plugin() = default;

    /// Return metadata about this plugin instance.
    virtual Info info() const = 0;

    /// Return false to unload the plugin right away.
    virtual bool init() { return true; }

    virtual void term() {}

    /// Called when the user invokes the plugin.
    virtual Status run(std::size_t arg) = 0;
};

/// Factory function type for ABIX_PLUGIN macro.
using PluginFactory = Plugin* (*)();

namespace detail {

/// Register a plugin factory so the export block can construct it.
/// Called by the ABIX_PLUGIN macro at static-init time.
void* make_plugin_export(PluginFactory factory);

} // namespace detail

} // namespace abix::plugin

/// Generate the IDA plugin export glue for the given Plugin subclass.
#define ABIX_PLUGIN(ClassName)                                              \
    static_assert(std::is_base_of_v<abix::plugin::Plugin, ClassName>,      \
                  #ClassName " must inherit from abix::plugin::Plugin");    \
    static_assert(std::is_default_constructible_v<ClassName>,              \
                  #ClassName " must be default-constructible");             \
    namespace {                                                             \
    abix::plugin::Plugin* abix_factory_##ClassName() {                     \
        return new ClassName();                                             \
    }                                                                       \
    } /* anonymous */                                                       \
    static void* abix_reg_##ClassName =                                    \
        abix::plugin::detail::make_plugin_export(abix_factory_##ClassName);

#endif // ABIX_PLUGIN_HPP
