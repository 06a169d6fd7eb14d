#include "myprocshell.hpp"

#include "luaref.hpp"
#include "safecall.hpp"
#include "strings.hpp"
#include "userdata.hpp"

#include <procshell/command.hpp>

extern "C" {
#include <lauxlib.h>
#include <lua.h>
}

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using procshell::Child;
using procshell::Command;

template<> char const* udata_name<Command> = "procshell.command";
template<> char const* udata_name<Child> = "procshell.child";

namespace {

char host_key;

auto get_host(lua_State* const L) -> procshell::Host&
{
    lua_rawgetp(L, LUA_REGISTRYINDEX, &host_key);
    auto const host = static_cast<procshell::Host*>(lua_touserdata(L, -1));
    lua_pop(L, 1);
    if (nullptr == host)
    {
        luaL_error(L, "procshell: no host installed");
    }
    return *host;
}

using Callback = std::shared_ptr<LuaRef>;

/// @brief Store the function at the given index for a later callback
auto make_callback(lua_State* const L, int const arg) -> Callback
{
    lua_pushvalue(L, arg);
    return std::make_shared<LuaRef>(LuaRef::create(L));
}

auto push_buffer(lua_State* const L, procshell::Buffer const& buffer) -> void
{
    if (auto const* const text = std::get_if<std::string>(&buffer))
    {
        push_string(L, *text);
    }
    else
    {
        auto const& bytes = std::get<procshell::Bytes>(buffer);
        lua_pushlstring(L, reinterpret_cast<char const*>(bytes.data()), bytes.size());
    }
}

auto push_optional_integer(lua_State* const L, std::optional<int> const value) -> void
{
    if (value)
    {
        lua_pushinteger(L, *value);
    }
    else
    {
        lua_pushnil(L);
    }
}

auto push_status(lua_State* const L, procshell::event::Terminated const& status) -> void
{
    lua_createtable(L, 0, 2);
    push_optional_integer(L, status.code);
    lua_setfield(L, -2, "code");
    push_optional_integer(L, status.signal);
    lua_setfield(L, -2, "signal");
}

auto push_event(lua_State* const L, procshell::Event const& event) -> void
{
    if (auto const* const error = std::get_if<procshell::event::Error>(&event))
    {
        push_string(L, error->message);
    }
    else if (auto const* const terminated = std::get_if<procshell::event::Terminated>(&event))
    {
        push_status(L, *terminated);
    }
    else if (auto const* const out = std::get_if<procshell::event::Stdout>(&event))
    {
        push_buffer(L, out->line);
    }
    else
    {
        push_buffer(L, std::get<procshell::event::Stderr>(event).line);
    }
}

auto exception_message(std::exception_ptr const& error) -> std::string
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (std::exception const& e)
    {
        return e.what();
    }
}

/// @brief Completion for child:write and child:kill
auto child_completion(Callback callback, char const* const location)
{
    return [callback = std::move(callback), location](boost::system::error_code const error) {
        if (not callback)
        {
            return;
        }
        auto const L = callback->get_lua();
        callback->push();
        if (error)
        {
            luaL_pushfail(L);
            push_string(L, error.message());
            safecall(L, location, 2);
        }
        else
        {
            lua_pushboolean(L, true);
            safecall(L, location, 1);
        }
    };
}

luaL_Reg const ChildMethods[] {
    {"pid", [](auto const L) {
        auto const child = check_udata<Child>(L, 1);
        lua_pushinteger(L, child->pid());
        return 1;
    }},

    {"write", [](auto const L) {
        auto const child = check_udata<Child>(L, 1);
        auto const data_type = lua_type(L, 2);
        luaL_argexpected(L, LUA_TSTRING == data_type || LUA_TTABLE == data_type, 2, "string or table");
        if (LUA_TTABLE == data_type)
        {
            auto const n = luaL_len(L, 2);
            for (lua_Integer i = 1; i <= n; i++)
            {
                lua_rawgeti(L, 2, i);
                auto const valid = lua_isinteger(L, -1) && lua_tointeger(L, -1) >= 0 && lua_tointeger(L, -1) <= 255;
                lua_pop(L, 1);
                luaL_argcheck(L, valid, 2, "bytes must be integers from 0 to 255");
            }
        }
        if (not lua_isnoneornil(L, 3))
        {
            luaL_checktype(L, 3, LUA_TFUNCTION);
        }

        // no Lua errors past this point
        procshell::Buffer data;
        if (LUA_TTABLE == data_type)
        {
            procshell::Bytes bytes;
            auto const n = luaL_len(L, 2);
            bytes.reserve(n);
            for (lua_Integer i = 1; i <= n; i++)
            {
                lua_rawgeti(L, 2, i);
                bytes.push_back(static_cast<std::uint8_t>(lua_tointeger(L, -1)));
                lua_pop(L, 1);
            }
            data = std::move(bytes);
        }
        else
        {
            data = std::string{to_string_view(L, 2)};
        }

        auto callback = lua_isnoneornil(L, 3) ? Callback{} : make_callback(L, 3);
        child->async_write(std::move(data), child_completion(std::move(callback), "child write callback"));
        return 0;
    }},

    {"kill", [](auto const L) {
        auto const child = check_udata<Child>(L, 1);
        if (not lua_isnoneornil(L, 2))
        {
            luaL_checktype(L, 2, LUA_TFUNCTION);
        }
        auto callback = lua_isnoneornil(L, 2) ? Callback{} : make_callback(L, 2);
        child->async_kill(child_completion(std::move(callback), "child kill callback"));
        return 0;
    }},

    {}
};

auto push_child(lua_State* const L, Child const child) -> void
{
    auto const ptr = new_udata<Child>(L, 0, [L]() {
        luaL_newlibtable(L, ChildMethods);
        luaL_setfuncs(L, ChildMethods, 0);
        lua_setfield(L, -2, "__index");
    });
    std::construct_at(ptr, child);
}

auto register_listener(lua_State* const L, bool const once) -> int
{
    auto const command = check_udata<Command>(L, 1);
    auto const name = check_string_view(L, 2);
    luaL_checktype(L, 3, LUA_TFUNCTION);

    auto listener = [callback = make_callback(L, 3), name = std::string{name}](procshell::Event const& event) {
        auto const L = callback->get_lua();
        callback->push();
        push_event(L, event);
        safecall(L, name.c_str(), 1);
    };

    if (once)
    {
        command->once(name, std::move(listener));
    }
    else
    {
        command->on(name, std::move(listener));
    }
    lua_settop(L, 1);
    return 1;
}

auto register_stream_listener(lua_State* const L, procshell::Command::StreamEmitter& emitter, char const* const location) -> int
{
    luaL_checktype(L, 2, LUA_TFUNCTION);
    emitter.on("data", [callback = make_callback(L, 2), location](procshell::Buffer const& line) {
        auto const L = callback->get_lua();
        callback->push();
        push_buffer(L, line);
        safecall(L, location, 1);
    });
    lua_settop(L, 1);
    return 1;
}

luaL_Reg const CommandMethods[] {
    {"on", [](auto const L) {
        return register_listener(L, false);
    }},

    {"once", [](auto const L) {
        return register_listener(L, true);
    }},

    {"stdout_on", [](auto const L) {
        auto const command = check_udata<Command>(L, 1);
        return register_stream_listener(L, command->stdout_emitter(), "stdout data");
    }},

    {"stderr_on", [](auto const L) {
        auto const command = check_udata<Command>(L, 1);
        return register_stream_listener(L, command->stderr_emitter(), "stderr data");
    }},

    {"spawn", [](auto const L) {
        auto const command = check_udata<Command>(L, 1);
        luaL_checktype(L, 2, LUA_TFUNCTION);

        command->async_spawn([callback = make_callback(L, 2)](boost::system::error_code const error, Child const child) {
            auto const L = callback->get_lua();
            callback->push();
            if (error)
            {
                luaL_pushfail(L);
                push_string(L, error.message());
                safecall(L, "spawn failure callback", 2);
            }
            else
            {
                push_child(L, child);
                safecall(L, "spawn success callback", 1);
            }
        });
        return 0;
    }},

    {"execute", [](auto const L) {
        auto const command = check_udata<Command>(L, 1);
        luaL_checktype(L, 2, LUA_TFUNCTION);

        command->async_execute([callback = make_callback(L, 2)](std::exception_ptr const error, procshell::ExecOutput const& output) {
            auto const L = callback->get_lua();
            callback->push();
            if (error)
            {
                luaL_pushfail(L);
                push_string(L, exception_message(error));
                safecall(L, "execute failure callback", 2);
            }
            else
            {
                lua_createtable(L, 0, 4);
                push_optional_integer(L, output.code);
                lua_setfield(L, -2, "code");
                push_optional_integer(L, output.signal);
                lua_setfield(L, -2, "signal");
                push_buffer(L, output.stdout_data);
                lua_setfield(L, -2, "stdout");
                push_buffer(L, output.stderr_data);
                lua_setfield(L, -2, "stderr");
                safecall(L, "execute complete callback", 1);
            }
        });
        return 0;
    }},

    {}
};

/**
 * @brief Validate command arguments before any C++ object is created
 *
 * Lua errors unwind with longjmp, so everything that can raise one
 * happens here.
 */
auto check_command_arguments(lua_State* const L) -> void
{
    luaL_checkstring(L, 1);

    switch (lua_type(L, 2))
    {
    case LUA_TNONE:
    case LUA_TNIL:
    case LUA_TSTRING:
        break;
    case LUA_TTABLE:
    {
        auto const n = luaL_len(L, 2);
        for (lua_Integer i = 1; i <= n; i++)
        {
            auto const t = lua_rawgeti(L, 2, i);
            lua_pop(L, 1);
            luaL_argcheck(L, LUA_TSTRING == t, 2, "arguments must be strings");
        }
        break;
    }
    default:
        luaL_typeerror(L, 2, "string or table");
    }

    if (lua_isnoneornil(L, 3))
    {
        return;
    }
    luaL_checktype(L, 3, LUA_TTABLE);

    auto const cwd_type = lua_getfield(L, 3, "cwd");
    luaL_argcheck(L, LUA_TNIL == cwd_type || LUA_TSTRING == cwd_type, 3, "cwd must be a string");
    lua_pop(L, 1);

    auto const env_type = lua_getfield(L, 3, "env");
    if (LUA_TTABLE == env_type)
    {
        lua_pushnil(L);
        while (lua_next(L, -2))
        {
            auto const valid = LUA_TSTRING == lua_type(L, -2) && LUA_TSTRING == lua_type(L, -1);
            lua_pop(L, 1);
            luaL_argcheck(L, valid, 3, "env must map strings to strings");
        }
    }
    else
    {
        luaL_argcheck(L, LUA_TNIL == env_type || (LUA_TBOOLEAN == env_type && not lua_toboolean(L, -1)), 3, "env must be a table or false");
    }
    lua_pop(L, 1);

    auto const encoding_type = lua_getfield(L, 3, "encoding");
    luaL_argcheck(L, LUA_TNIL == encoding_type || LUA_TSTRING == encoding_type, 3, "encoding must be a string");
    lua_pop(L, 1);
}

auto read_args(lua_State* const L) -> procshell::Args
{
    if (LUA_TSTRING == lua_type(L, 2))
    {
        return std::string{to_string_view(L, 2)};
    }

    std::vector<std::string> args;
    if (LUA_TTABLE == lua_type(L, 2))
    {
        auto const n = luaL_len(L, 2);
        args.reserve(n);
        for (lua_Integer i = 1; i <= n; i++)
        {
            lua_rawgeti(L, 2, i);
            args.emplace_back(to_string_view(L, -1));
            lua_pop(L, 1);
        }
    }
    return args;
}

auto read_options(lua_State* const L) -> procshell::SpawnOptions
{
    procshell::SpawnOptions options;
    if (lua_isnoneornil(L, 3))
    {
        return options;
    }

    if (LUA_TSTRING == lua_getfield(L, 3, "cwd"))
    {
        options.cwd = std::string{to_string_view(L, -1)};
    }
    lua_pop(L, 1);

    switch (lua_getfield(L, 3, "env"))
    {
    case LUA_TTABLE:
        lua_pushnil(L);
        while (lua_next(L, -2))
        {
            options.env->insert_or_assign(std::string{to_string_view(L, -2)}, std::string{to_string_view(L, -1)});
            lua_pop(L, 1);
        }
        break;
    case LUA_TBOOLEAN:
        options.env.reset();
        break;
    }
    lua_pop(L, 1);

    // labels other than these name the character set of text output
    if (LUA_TSTRING == lua_getfield(L, 3, "encoding"))
    {
        auto const encoding = to_string_view(L, -1);
        if (encoding == "raw")
        {
            options.encoding = procshell::Encoding::Raw;
        }
        else if (encoding != "text")
        {
            options.charset = std::string{encoding};
        }
    }
    lua_pop(L, 1);

    return options;
}

auto new_command(lua_State* const L, bool const sidecar) -> int
{
    check_command_arguments(L);
    auto& host = get_host(L);

    auto const ptr = new_udata<Command>(L, 0, [L]() {
        lua_pushcfunction(L, gc_udata<Command>);
        lua_setfield(L, -2, "__gc");
        luaL_newlibtable(L, CommandMethods);
        luaL_setfuncs(L, CommandMethods, 0);
        lua_setfield(L, -2, "__index");
    });

    auto const program = std::string{to_string_view(L, 1)};
    std::construct_at(ptr, sidecar
        ? Command::sidecar(host, program, read_args(L), read_options(L))
        : Command::create(host, program, read_args(L), read_options(L)));
    return 1;
}

} // namespace

auto set_procshell_host(lua_State* const L, procshell::Host& host) -> void
{
    lua_pushlightuserdata(L, &host);
    lua_rawsetp(L, LUA_REGISTRYINDEX, &host_key);
}

extern "C" auto luaopen_myprocshell(lua_State* const L) -> int
{
    static luaL_Reg const M[] {
        {"command", [](auto const L) { return new_command(L, false); }},
        {"sidecar", [](auto const L) { return new_command(L, true); }},
        {}
    };

    get_host(L);
    luaL_newlib(L, M);
    return 1;
}
