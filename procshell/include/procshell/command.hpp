#pragma once
/**
 * @file command.hpp
 * @brief Command builder and process supervisor
 *
 * A Command names a program, its arguments and spawn options. It can be
 * spawned, yielding a Child handle while events stream through its
 * emitters, or executed, yielding the collected output once the process
 * terminates.
 *
 * Events of a spawned process are dispatched to:
 *
 * - "error" on the command itself with an event::Error payload
 * - "close" on the command itself with an event::Terminated payload
 * - "data" on stdout_emitter() with each stdout line
 * - "data" on stderr_emitter() with each stderr line
 *
 * These emitters observe every spawn of the command. An execute
 * operation collects its output from emitters of its own that only its
 * spawn feeds, so overlapping executions stay independent.
 */

#include "buffer.hpp"
#include "child.hpp"
#include "event.hpp"
#include "event_emitter.hpp"
#include "host.hpp"
#include "options.hpp"
#include "output.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <exception>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace procshell {

/// @brief Argument list accepting either a single string or a sequence
class Args
{
    std::vector<std::string> args_;

public:
    Args() = default;
    Args(std::initializer_list<std::string> args) : args_{args} {}
    Args(std::vector<std::string> args) : args_{std::move(args)} {}
    Args(std::string arg) : args_{std::move(arg)} {}
    Args(char const* arg) : args_{std::string{arg}} {}

    auto release() && -> std::vector<std::string>
    {
        return std::move(args_);
    }
};

class Command
{
public:
    using RootEmitter = EventEmitter<Event>;
    using StreamEmitter = EventEmitter<Buffer>;

    using SpawnSignature = void(boost::system::error_code, Child);
    using ExecuteSignature = void(std::exception_ptr, ExecOutput);

private:
    struct Emitters
    {
        RootEmitter root;
        StreamEmitter out;
        StreamEmitter err;
    };

    Host* host_;
    std::string program_;
    std::vector<std::string> args_;
    SpawnOptions options_;
    std::shared_ptr<Emitters> emitters_;

    Command(Host& host, std::string program, std::vector<std::string> args, SpawnOptions options);

    static auto dispatch(Emitters& emitters, Event const& event) -> void;

    auto start_spawn(std::shared_ptr<Emitters> own, std::function<void(boost::system::error_code, Child)> handler) const -> void;
    auto start_execute(std::function<void(std::exception_ptr, ExecOutput)> handler) const -> void;

public:
    /**
     * @brief Construct a command for a program found by the host
     *
     * @param host host that will run the process
     * @param program program name or path
     * @param args program arguments
     * @param options spawn options
     * @return Command new command
     */
    static auto create(Host& host, std::string program, Args args = {}, SpawnOptions options = {}) -> Command;

    /// @brief Construct a command for a bundled executable
    static auto sidecar(Host& host, std::string program, Args args = {}, SpawnOptions options = {}) -> Command;

    // emitters are shared with in-flight processes
    Command(Command const&) = delete;
    auto operator=(Command const&) -> Command& = delete;
    Command(Command&&) = default;
    auto operator=(Command&&) -> Command& = default;

    auto program() const -> std::string const& { return program_; }
    auto args() const -> std::vector<std::string> const& { return args_; }
    auto options() const -> SpawnOptions const& { return options_; }

    auto stdout_emitter() -> StreamEmitter& { return emitters_->out; }
    auto stderr_emitter() -> StreamEmitter& { return emitters_->err; }

    auto on(std::string_view const name, RootEmitter::Listener listener) -> Command&
    {
        emitters_->root.on(name, std::move(listener));
        return *this;
    }

    auto once(std::string_view const name, RootEmitter::Listener listener) -> Command&
    {
        emitters_->root.once(name, std::move(listener));
        return *this;
    }

    auto off(std::string_view const name, RootEmitter::Listener const& listener) -> Command&
    {
        emitters_->root.off(name, listener);
        return *this;
    }

    auto prepend_listener(std::string_view const name, RootEmitter::Listener listener) -> Command&
    {
        emitters_->root.prepend_listener(name, std::move(listener));
        return *this;
    }

    auto prepend_once_listener(std::string_view const name, RootEmitter::Listener listener) -> Command&
    {
        emitters_->root.prepend_once_listener(name, std::move(listener));
        return *this;
    }

    auto remove_all_listeners() -> Command&
    {
        emitters_->root.remove_all_listeners();
        return *this;
    }

    auto remove_all_listeners(std::string_view const name) -> Command&
    {
        emitters_->root.remove_all_listeners(name);
        return *this;
    }

    auto listener_count(std::string_view const name) const -> std::size_t
    {
        return emitters_->root.listener_count(name);
    }

    /**
     * @brief Start the process without waiting for it
     *
     * Completes with a Child once the host accepted the request. Events
     * of the process are dispatched to this command's emitters, and none
     * arrive before the completion. When the host denies the request the
     * completion carries its error code and no event is ever dispatched.
     *
     * @param token completion token for void(error_code, Child)
     */
    template <boost::asio::completion_token_for<SpawnSignature> CompletionToken>
    auto async_spawn(CompletionToken&& token) const
    {
        return boost::asio::async_initiate<CompletionToken, SpawnSignature>(
            [this](auto handler) {
                start_spawn(nullptr, detail::share_handler<boost::system::error_code, Child>(std::move(handler), host_->get_executor()));
            },
            token);
    }

    /**
     * @brief Run the process to completion and collect its output
     *
     * Completes with the exit status and the folded stdout and stderr
     * on termination. Fails with boost::system::system_error when the
     * spawn is denied, or with ProcessError when the host reports an
     * error while the process runs; output received before such an
     * error is discarded.
     *
     * @param token completion token for void(exception_ptr, ExecOutput)
     */
    template <boost::asio::completion_token_for<ExecuteSignature> CompletionToken>
    auto async_execute(CompletionToken&& token) const
    {
        return boost::asio::async_initiate<CompletionToken, ExecuteSignature>(
            [this](auto handler) {
                start_execute(detail::share_handler<std::exception_ptr, ExecOutput>(std::move(handler), host_->get_executor()));
            },
            token);
    }
};

} // namespace procshell
