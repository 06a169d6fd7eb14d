#include "app.hpp"

#include "config.hpp"

#include <myprocshell.hpp>
#include <safecall.hpp>

#include <procshell/errors.hpp>

extern "C"
{
#include <lauxlib.h>
#include <lua.h>
#include <lualib.h>
}

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

namespace {

auto make_scope(configuration const& cfg) -> prochost::Scope
{
    prochost::Scope scope;
    for (auto const& program : cfg.allowed)
    {
        if (cfg.sidecar)
        {
            scope.allow_sidecar(program);
        }
        else
        {
            scope.allow_program(program);
        }
    }

    // with no explicit allow-list the requested program is allowed
    if (scope.empty() && not cfg.command.empty())
    {
        if (cfg.sidecar)
        {
            scope.allow_sidecar(cfg.command.front());
        }
        else
        {
            scope.allow_program(cfg.command.front());
        }
    }
    return scope;
}

auto write_buffer(std::ostream& out, procshell::Buffer const& buffer) -> void
{
    if (auto const* const text = std::get_if<std::string>(&buffer))
    {
        out << *text;
    }
    else
    {
        auto const& bytes = std::get<procshell::Bytes>(buffer);
        out.write(reinterpret_cast<char const*>(bytes.data()), bytes.size());
    }
}

/// @brief Print collected output, terminating text with a newline
auto write_output(std::ostream& out, procshell::Buffer const& buffer) -> void
{
    write_buffer(out, buffer);
    if (auto const* const text = std::get_if<std::string>(&buffer); text && not text->empty())
    {
        out << '\n';
    }
    out.flush();
}

/// @brief Print one streamed line
auto write_line(std::ostream& out, procshell::Buffer const& line) -> void
{
    write_buffer(out, line);
    out << '\n';
    out.flush();
}

auto prepare_globals(lua_State* const L, std::vector<std::string> const& args) -> void
{
    luaL_openlibs(L);

    luaL_requiref(L, "procshell", luaopen_myprocshell, 1);
    lua_pop(L, 1);

    lua_createtable(L, static_cast<int>(args.size()), 0);
    for (std::size_t i = 0; i < args.size(); i++)
    {
        lua_pushlstring(L, args[i].data(), args[i].size());
        lua_rawseti(L, -2, i + 1);
    }
    lua_setglobal(L, "arg");

    // scripts installed alongside procrun are found by require
    lua_getglobal(L, "package");
    lua_pushstring(L, CMAKE_INSTALL_FULL_DATAROOTDIR "/procrun/lua/?.lua;");
    lua_getfield(L, -2, "path");
    lua_concat(L, 2);
    lua_setfield(L, -2, "path");
    lua_pop(L, 1);
}

} // namespace

auto exit_status_of(procshell::event::Terminated const& status) -> int
{
    if (status.signal)
    {
        return 128 + *status.signal;
    }
    return status.code.value_or(EXIT_FAILURE);
}

App::App(configuration const& cfg)
    : io_context{}
    , stdin_poll{io_context}
    , signals{io_context}
    , host{io_context, make_scope(cfg)}
    , L{nullptr}
    , cfg{cfg}
    , exit_status{EXIT_SUCCESS}
{
}

App::~App()
{
    if (L)
    {
        lua_close(L);
    }
}

auto App::make_command() const -> procshell::Command
{
    procshell::SpawnOptions options;
    options.encoding = cfg.encoding;
    if (cfg.charset)
    {
        options.charset = cfg.charset;
    }
    if (cfg.cwd)
    {
        options.cwd = cfg.cwd;
    }
    if (cfg.clear_environment)
    {
        options.env.reset();
    }
    else
    {
        for (auto const& entry : cfg.environment)
        {
            auto const eq = entry.find('=');
            options.env->insert_or_assign(entry.substr(0, eq), entry.substr(eq + 1));
        }
    }

    std::vector<std::string> args(cfg.command.begin() + 1, cfg.command.end());
    if (cfg.sidecar)
    {
        return procshell::Command::sidecar(host, cfg.command.front(), std::move(args), std::move(options));
    }
    return procshell::Command::create(host, cfg.command.front(), std::move(args), std::move(options));
}

auto App::execute_thread(procshell::Command& command) -> boost::asio::awaitable<void>
{
    try
    {
        auto const output = co_await command.async_execute(boost::asio::use_awaitable);
        write_output(std::cout, output.stdout_data);
        write_output(std::cerr, output.stderr_data);
        exit_status = exit_status_of({output.code, output.signal});
    }
    catch (boost::system::system_error const& e)
    {
        std::cerr << "procrun: " << e.code().message() << std::endl;
        exit_status = EXIT_FAILURE;
    }
    catch (procshell::ProcessError const& e)
    {
        std::cerr << "procrun: " << e.what() << std::endl;
        exit_status = EXIT_FAILURE;
    }
    shutdown();
}

auto App::spawn_thread(procshell::Command& command) -> boost::asio::awaitable<void>
{
    command.stdout_emitter().on("data", [](procshell::Buffer const& line) {
        write_line(std::cout, line);
    });
    command.stderr_emitter().on("data", [](procshell::Buffer const& line) {
        write_line(std::cerr, line);
    });
    command.once("close", [this](procshell::Event const& event) {
        exit_status = exit_status_of(std::get<procshell::event::Terminated>(event));
        shutdown();
    });
    command.once("error", [this](procshell::Event const& event) {
        std::cerr << "procrun: " << std::get<procshell::event::Error>(event).message << std::endl;
        exit_status = EXIT_FAILURE;
        shutdown();
    });

    boost::system::error_code error;
    auto const child = co_await command.async_spawn(boost::asio::redirect_error(boost::asio::use_awaitable, error));
    if (error)
    {
        std::cerr << "procrun: " << error.message() << std::endl;
        exit_status = EXIT_FAILURE;
        shutdown();
        co_return;
    }

    signals.add(SIGINT);
    signals.add(SIGTERM);
    boost::asio::co_spawn(io_context, signal_thread(child), boost::asio::detached);

    // stdin that cannot be polled (a regular file) is not forwarded
    stdin_poll.assign(dup(STDIN_FILENO), error);
    if (error)
    {
        std::cerr << "procrun: stdin not forwarded: " << error.message() << std::endl;
    }
    else
    {
        boost::asio::co_spawn(io_context, stdin_thread(child), boost::asio::detached);
    }
}

auto App::signal_thread(procshell::Child child) -> boost::asio::awaitable<void>
{
    for (;;)
    {
        boost::system::error_code error;
        co_await signals.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error)
        {
            co_return;
        }

        co_await child.async_kill(boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error)
        {
            std::cerr << "procrun: kill: " << error.message() << std::endl;
        }
    }
}

auto App::stdin_thread(procshell::Child child) -> boost::asio::awaitable<void>
{
    std::string buffer(4096, '\0');

    for (;;)
    {
        boost::system::error_code error;
        auto const n = co_await stdin_poll.async_read_some(
            boost::asio::buffer(buffer),
            boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error)
        {
            if (boost::asio::error::eof != error && boost::asio::error::operation_aborted != error)
            {
                std::cerr << "procrun: stdin: " << error.message() << std::endl;
            }
            co_return;
        }

        co_await child.async_write(buffer.substr(0, n), boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error)
        {
            std::cerr << "procrun: write: " << error.message() << std::endl;
            co_return;
        }
    }
}

auto App::run_script() -> bool
{
    L = luaL_newstate();
    set_procshell_host(L, host);
    prepare_globals(L, cfg.command);

    auto const r = luaL_loadfile(L, cfg.lua_filename);
    if (LUA_OK == r)
    {
        return LUA_OK == safecall(L, "script", 0);
    }
    else
    {
        auto const err = lua_tolstring(L, -1, nullptr);
        std::cerr << "error in script:load: " << err << std::endl;
        lua_pop(L, 1);
        return false;
    }
}

auto App::startup() -> int
{
    if (cfg.lua_filename)
    {
        if (not run_script())
        {
            exit_status = EXIT_FAILURE;
        }
        io_context.run();
        return exit_status;
    }

    auto command = make_command();
    if (cfg.interactive)
    {
        boost::asio::co_spawn(io_context, spawn_thread(command), boost::asio::detached);
    }
    else
    {
        boost::asio::co_spawn(io_context, execute_thread(command), boost::asio::detached);
    }
    io_context.run();
    return exit_status;
}

auto App::shutdown() -> void
{
    boost::system::error_code ignored;
    stdin_poll.close(ignored);
    signals.cancel(ignored);
}
