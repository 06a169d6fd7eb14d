#pragma once
/**
 * @file app.hpp
 * @brief Core application model of procrun
 *
 */

#include "configuration.hpp"

#include <prochost/local_host.hpp>
#include <procshell/command.hpp>

#include <boost/asio.hpp>

struct lua_State;

class App
{
    boost::asio::io_context io_context;
    boost::asio::posix::stream_descriptor stdin_poll;
    boost::asio::signal_set signals;
    prochost::LocalHost host;
    lua_State* L;
    configuration const& cfg;
    int exit_status;

public:
    App(configuration const&);
    ~App();

    App(App const&) = delete;
    App(App&&) = delete;
    auto operator=(App const&) -> App& = delete;
    auto operator=(App&&) -> App& = delete;

    /// @brief Run until the program or script is done
    /// @return process exit status
    auto startup() -> int;
    auto shutdown() -> void;

private:
    auto make_command() const -> procshell::Command;
    auto run_script() -> bool;

    auto execute_thread(procshell::Command&) -> boost::asio::awaitable<void>;
    auto spawn_thread(procshell::Command&) -> boost::asio::awaitable<void>;
    auto signal_thread(procshell::Child) -> boost::asio::awaitable<void>;
    auto stdin_thread(procshell::Child) -> boost::asio::awaitable<void>;
};

/// @brief Exit status reflecting how a child terminated
auto exit_status_of(procshell::event::Terminated const& status) -> int;
