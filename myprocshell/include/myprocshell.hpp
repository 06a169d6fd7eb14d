/**
 * @file myprocshell.hpp
 * @brief Process spawning and execution for Lua
 *
 * ## Lua Interface
 *
 * ```lua
 * local cmd = procshell.command(program [, args [, options]])
 * local cmd = procshell.sidecar(program [, args [, options]])
 * ```
 *
 * - `args` (string or table): a single argument or an array of arguments
 * - `options` (table):
 *     - `cwd` (string): working directory
 *     - `env` (table or false): added variables, or false for an empty environment
 *     - `encoding` (string): `"raw"` for byte strings, `"text"` for UTF-8,
 *       or a character set label such as `"windows-1252"`. Unknown labels
 *       make `spawn` and `execute` fail.
 *
 * Commands:
 *
 * - `cmd:on(event, fn)` / `cmd:once(event, fn)`: `"close"` passes a table
 *   `{code=, signal=}`, `"error"` passes the message
 * - `cmd:stdout_on(fn)` / `cmd:stderr_on(fn)`: called with each output line
 * - `cmd:spawn(callback)`: `callback(child)` or `callback(nil, message)`
 * - `cmd:execute(callback)`: `callback({code=, signal=, stdout=, stderr=})`
 *   or `callback(nil, message)`
 *
 * Children:
 *
 * - `child:write(data [, callback])`: data is a string or an array of bytes
 * - `child:kill([callback])`
 * - `child:pid()`
 *
 * Write and kill callbacks receive `true` or `nil, message`.
 */
#pragma once

struct lua_State;

namespace procshell {
class Host;
}

/**
 * @brief Install the host used by commands created from Lua
 *
 * The host must outlive every command and child created by the library.
 *
 * @param L Lua state
 * @param host host running the processes
 */
auto set_procshell_host(lua_State* L, procshell::Host& host) -> void;

extern "C" auto luaopen_myprocshell(lua_State* const L) -> int;
