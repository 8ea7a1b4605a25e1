#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace verdict::log {

void init(spdlog::level::level_enum level,
          const std::filesystem::path& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger =
        std::make_shared<spdlog::logger>("verdict", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level '{}'",
                  spdlog::level::to_string_view(level));
}

bool parse_level(std::string_view name, spdlog::level::level_enum& level) {
    static constexpr std::pair<std::string_view, spdlog::level::level_enum>
        kLevels[] = {
            {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
            {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
            {"off", spdlog::level::off},
        };
    for (const auto& [key, value] : kLevels) {
        if (key == name) {
            level = value;
            return true;
        }
    }
    return false;
}

void shutdown() {
    spdlog::shutdown();
}

/// Concatenate all Lua arguments into a single string.
static std::string lua_concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        if (lua_isnil(L, i)) {
            result += "nil";
        } else if (lua_isboolean(L, i)) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else if (lua_isstring(L, i)) {
            result += lua_tostring(L, i);
        } else {
            result += lua_typename(L, lua_type(L, i));
        }
    }
    return result;
}

int l_LOG(lua_State* L) {
    spdlog::info("{}", lua_concat_args(L));
    return 0;
}

int l_WARN(lua_State* L) {
    spdlog::warn("{}", lua_concat_args(L));
    return 0;
}

int l_SPEW(lua_State* L) {
    spdlog::debug("{}", lua_concat_args(L));
    return 0;
}

int l_ALERT(lua_State* L) {
    spdlog::error("{}", lua_concat_args(L));
    return 0;
}

} // namespace verdict::log
