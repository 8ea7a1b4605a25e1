#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

struct lua_State;

namespace verdict::lua {

/// RAII wrapper around a Lua state used to evaluate configuration scripts.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Set a global string variable.
    void set_global_string(const char* name, const char* value);

    /// Set a global boolean.
    void set_global_bool(const char* name, bool value);

    /// Read globals. nullopt if unset or of another type.
    std::optional<std::string> get_global_string(const char* name) const;
    std::optional<double> get_global_number(const char* name) const;
    std::optional<bool> get_global_bool(const char* name) const;

    /// True if the global exists (is not nil).
    bool has_global(const char* name) const;

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    lua_State* L_ = nullptr;
};

} // namespace verdict::lua
