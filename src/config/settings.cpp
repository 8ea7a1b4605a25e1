#include "config/settings.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"

#include <cmath>
#include <string>

namespace verdict::config {

namespace {

constexpr int kMaxIndent = 16;

void prepare(lua::LuaState& state, const fs::path& base_dir) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("ALERT", log::l_ALERT);

    auto dir = base_dir.generic_string();
    state.set_global_string("ConfigDir", dir.c_str());
}

Result<Settings> read_settings(const lua::LuaState& state,
                               const fs::path& base_dir) {
    Settings settings;

    if (state.has_global("log_level")) {
        auto level = state.get_global_string("log_level");
        if (!level) {
            return Error::configuration("log_level must be a string");
        }
        if (!log::parse_level(*level, settings.log_level)) {
            return Error::configuration("Unknown log_level '" + *level + "'");
        }
    }

    if (state.has_global("log_file")) {
        auto file = state.get_global_string("log_file");
        if (!file) {
            return Error::configuration("log_file must be a string");
        }
        fs::path path(*file);
        if (path.is_relative() && !base_dir.empty()) {
            path = base_dir / path;
        }
        settings.log_file = path;
    }

    if (state.has_global("json_indent")) {
        auto indent = state.get_global_number("json_indent");
        if (!indent || std::floor(*indent) != *indent || *indent < 0 ||
            *indent > kMaxIndent) {
            return Error::configuration("json_indent must be an integer between 0 and " +
                                        std::to_string(kMaxIndent));
        }
        settings.json_indent = static_cast<int>(*indent);
    }

    return settings;
}

} // namespace

Result<Settings> load_settings(const fs::path& path) {
    lua::LuaState state;
    if (!state.raw()) {
        return Error::configuration("Failed to create Lua state");
    }
    prepare(state, path.parent_path());

    spdlog::info("Loading settings: {}", path.string());
    return state.do_file(path).bind(
        [&] { return read_settings(state, path.parent_path()); });
}

Result<Settings> parse_settings(std::string_view script,
                                const fs::path& base_dir) {
    lua::LuaState state;
    if (!state.raw()) {
        return Error::configuration("Failed to create Lua state");
    }
    prepare(state, base_dir);

    return state.do_string(script).bind(
        [&] { return read_settings(state, base_dir); });
}

} // namespace verdict::config
