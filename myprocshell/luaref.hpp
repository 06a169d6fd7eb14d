#pragma once

/**
 * @file luaref.hpp
 * @brief Defines the LuaRef class for managing references to Lua objects in the registry.
 */

extern "C" {
#include <lauxlib.h>
#include <lua.h>
}

#include "safecall.hpp"

#include <utility>

/**
 * @class LuaRef
 * @brief Owns a reference to a Lua object stored in the Lua registry.
 *
 * The reference is released when the LuaRef is destroyed. References
 * are always held against the main thread so that they stay usable from
 * completion handlers after the registering coroutine is gone.
 */
class LuaRef
{
    lua_State* L_; ///< Main thread of the associated Lua state.
    int ref_;      ///< Registry reference to the Lua object.

    LuaRef(lua_State* const L, int const ref) noexcept
        : L_{L}
        , ref_{ref}
    {
    }

public:
    LuaRef(LuaRef&& value) noexcept
        : L_{}
        , ref_{LUA_NOREF}
    {
        swap(*this, value);
    }

    LuaRef(LuaRef const&) = delete;
    auto operator=(LuaRef const&) -> LuaRef& = delete;

    ~LuaRef()
    {
        if (ref_ != LUA_NOREF)
        {
            luaL_unref(L_, LUA_REGISTRYINDEX, ref_);
        }
    }

    /**
     * @brief Creates a LuaRef from the value on top of the Lua stack.
     *
     * The top value of the stack is consumed by this operation.
     *
     * @param L Any thread of the Lua state.
     * @return A new LuaRef referencing the value.
     */
    static auto create(lua_State* const L) -> LuaRef
    {
        return LuaRef{main_lua_state(L), luaL_ref(L, LUA_REGISTRYINDEX)};
    }

    /**
     * @brief Pushes the referenced Lua object onto the main thread's stack.
     */
    auto push() const noexcept -> void
    {
        lua_rawgeti(L_, LUA_REGISTRYINDEX, ref_);
    }

    /**
     * @brief Returns the main thread of the associated Lua state.
     */
    auto get_lua() const noexcept -> lua_State*
    {
        return L_;
    }

    friend auto swap(LuaRef& first, LuaRef& second) noexcept -> void
    {
        using std::swap;
        swap(first.L_, second.L_);
        swap(first.ref_, second.ref_);
    }
};
