#pragma once
/**
 * @file safecall.hpp
 * @brief Call Lua functions with backtrace reporting to stderr
 *
 */

struct lua_State;

/**
 * @brief Call a Lua function catching and reporting all errors
 *
 * @param L Lua interpreter handle
 * @param location Location to using in error reporting
 * @param args Number of function arguments on Lua stack
 * @return Result of lua_pcall
 */
int safecall(lua_State* L, char const* location, int args);

/**
 * @brief Find the main thread corresponding to an arbitrary thread.
 *
 * Callbacks are stored against the main thread: coroutine threads
 * are likely to be collected before an asynchronous operation
 * completes.
 *
 * @param L any thread
 * @return main thread
 */
auto main_lua_state(lua_State* const L) -> lua_State*;
