#include "lua/lua_state.hpp"

#include <fstream>
#include <system_error>
#include <spdlog/spdlog.h>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace verdict::lua {

LuaState::LuaState() {
    L_ = luaL_newstate();
    if (!L_) {
        spdlog::error("Failed to create Lua state");
        return;
    }
    luaL_openlibs(L_);
}

LuaState::~LuaState() {
    if (L_) {
        lua_close(L_);
    }
}

LuaState::LuaState(LuaState&& other) noexcept : L_(other.L_) {
    other.L_ = nullptr;
}

LuaState& LuaState::operator=(LuaState&& other) noexcept {
    if (this != &other) {
        if (L_) lua_close(L_);
        L_ = other.L_;
        other.L_ = nullptr;
    }
    return *this;
}

void LuaState::register_function(const char* name, int (*fn)(lua_State*)) {
    lua_register(L_, name, fn);
}

void LuaState::set_global_string(const char* name, const char* value) {
    lua_pushstring(L_, value);
    lua_setglobal(L_, name);
}

void LuaState::set_global_bool(const char* name, bool value) {
    lua_pushboolean(L_, value ? 1 : 0);
    lua_setglobal(L_, name);
}

std::optional<std::string> LuaState::get_global_string(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<std::string> value;
    if (lua_type(L_, -1) == LUA_TSTRING) {
        value = lua_tostring(L_, -1);
    }
    lua_pop(L_, 1);
    return value;
}

std::optional<double> LuaState::get_global_number(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<double> value;
    if (lua_type(L_, -1) == LUA_TNUMBER) {
        value = static_cast<double>(lua_tonumber(L_, -1));
    }
    lua_pop(L_, 1);
    return value;
}

std::optional<bool> LuaState::get_global_bool(const char* name) const {
    lua_getglobal(L_, name);
    std::optional<bool> value;
    if (lua_isboolean(L_, -1)) {
        value = lua_toboolean(L_, -1) != 0;
    }
    lua_pop(L_, 1);
    return value;
}

bool LuaState::has_global(const char* name) const {
    lua_getglobal(L_, name);
    bool present = !lua_isnil(L_, -1);
    lua_pop(L_, 1);
    return present;
}

Result<void> LuaState::do_string(std::string_view code) {
    return do_buffer(code.data(), code.size(), "=string");
}

Result<void> LuaState::do_file(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec) && !fs::is_regular_file(path, ec)) {
        return Error::configuration("Not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return Error::configuration("Failed to open file: " + path.string());
    }

    auto size = file.tellg();
    if (size < 0) {
        return Error::configuration("Failed to read file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> buffer(static_cast<size_t>(size));
    if (!file.read(buffer.data(), size)) {
        return Error::configuration("Failed to read file: " + path.string());
    }

    return do_buffer(buffer.data(), buffer.size(),
                     ("@" + path.string()).c_str());
}

Result<void> LuaState::do_buffer(const char* buf, size_t len,
                                 const char* name) {
    // Strip UTF-8 BOM if present
    if (len >= 3 && static_cast<unsigned char>(buf[0]) == 0xEF &&
        static_cast<unsigned char>(buf[1]) == 0xBB &&
        static_cast<unsigned char>(buf[2]) == 0xBF) {
        buf += 3;
        len -= 3;
    }

    int status = luaL_loadbuffer(L_, buf, len, name);
    if (status == 0) {
        status = lua_pcall(L_, 0, 0, 0);
    }
    if (status != 0) {
        const char* msg = lua_tostring(L_, -1);
        std::string err = (msg && *msg) ? msg : "unknown Lua error";
        lua_pop(L_, 1);
        return Error::configuration(std::move(err));
    }

    return {};
}

} // namespace verdict::lua
