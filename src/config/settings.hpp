#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>
#include <string_view>

namespace verdict::config {

/// Runtime settings, read from a Lua script such as:
///
///   log_level   = "debug"       -- trace|debug|info|warn|error|critical|off
///   log_file    = "verdict.log" -- optional; relative to the script's directory
///   json_indent = 2             -- 0 writes compact JSON
///
/// Scripts may call LOG/WARN/SPEW/ALERT and see ConfigDir.
struct Settings {
    spdlog::level::level_enum log_level = spdlog::level::info;
    fs::path log_file;
    int json_indent = 0;
};

/// Execute a settings file. Fails with a ConfigurationError if the file
/// cannot be run or a value is invalid.
Result<Settings> load_settings(const fs::path& path);

/// Same as load_settings() for an in-memory script. Relative log files
/// resolve against base_dir.
Result<Settings> parse_settings(std::string_view script,
                                const fs::path& base_dir = {});

} // namespace verdict::config
