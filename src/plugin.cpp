/// \file plugin.cpp
/// \brief The plugmod_t bridge and `plugin_t PLUGIN` export for ABIX_PLUGIN().
///
/// The ABIX_PLUGIN(ClassName) macro stores a factory during static init of
/// the plugin's TU. `PLUGIN` below holds only string buffers and function
/// pointers, so it does not depend on dynamic init order: by the time IDA
/// calls abix_plugin_init_, the factory is set.

#include "detail/sdk_bridge.hpp"
#include <abix/plugin.hpp>
#include <abix/diagnostics.hpp>

namespace abix::plugin {

PluginFactory g_plugin_factory = nullptr;

static char g_name_buf[256]    = "abix";
static char g_comment_buf[256] = "";
static char g_help_buf[256]    = "";
static char g_hotkey_buf[64]   = "";

/// plugmod_t adapter that owns the user's Plugin subclass.
class PlugmodAdapter : public plugmod_t {
public:
    explicit PlugmodAdapter(Plugin* plugin) : plugin_(plugin) {}

    ~PlugmodAdapter() override {
        if (plugin_) {
            plugin_->term();
            delete plugin_;
        }
    }

    bool idaapi run(size_t arg) override {
        if (!plugin_) return false;
        auto result = plugin_->run(arg);
        if (!result) {
            diagnostics::log(diagnostics::LogLevel::Error, "plugin",
                             error_text(result.error()));
        }
        return result.has_value();
    }

private:
    Plugin* plugin_;
};

namespace {

plugmod_t* idaapi abix_plugin_init_() {
    if (!g_plugin_factory)
        return nullptr;

    auto* plugin = g_plugin_factory();
    if (!plugin)
        return nullptr;

    if (!plugin->init()) {
        delete plugin;
        return nullptr;
    }

    auto info = plugin->info();
    qstrncpy(g_name_buf,    info.name.c_str(),    sizeof(g_name_buf));
    qstrncpy(g_comment_buf, info.comment.c_str(), sizeof(g_comment_buf));
    qstrncpy(g_help_buf,    info.help.c_str(),    sizeof(g_help_buf));
    qstrncpy(g_hotkey_buf,  info.hotkey.c_str(),  sizeof(g_hotkey_buf));

    return new PlugmodAdapter(plugin);
}

} // anonymous namespace

namespace detail {

void* make_plugin_export(PluginFactory factory) {
    g_plugin_factory = factory;
    return &g_plugin_factory;
}

} // namespace detail

} // namespace abix::plugin

// ── SDK plugin_t export ─────────────────────────────────────────────────

plugin_t PLUGIN = {
    IDP_INTERFACE_VERSION,
    PLUGIN_MULTI,
    abix::plugin::abix_plugin_init_,
    nullptr, // term: handled by ~PlugmodAdapter
    nullptr, // run: handled by PlugmodAdapter::run
    abix::plugin::g_comment_buf,
    abix::plugin::g_help_buf,
    abix::plugin::g_name_buf,
    abix::plugin::g_hotkey_buf,
};
