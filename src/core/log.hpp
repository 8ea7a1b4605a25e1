#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>
#include <string_view>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace verdict::log {

/// Initialize logging with a console sink and, if log_file is non-empty,
/// a file sink.
void init(spdlog::level::level_enum level = spdlog::level::info,
          const std::filesystem::path& log_file = {});

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
/// Returns false and leaves level untouched for anything else.
bool parse_level(std::string_view name, spdlog::level::level_enum& level);

/// Flush and shutdown logging.
void shutdown();

// Lua-side logging functions, available to configuration scripts
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace verdict::log
