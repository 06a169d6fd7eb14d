#pragma once
/**
 * @file host.hpp
 * @brief Asynchronous boundary to the service that owns real processes
 *
 * Everything that actually creates, feeds or kills a process happens
 * behind this interface. Policy checks (which programs may run) are the
 * host's business; requests that it accepts are trusted.
 */

#include "buffer.hpp"
#include "channel.hpp"
#include "options.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/system/error_code.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace procshell {

class Host
{
public:
    using SpawnHandler = std::function<void(boost::system::error_code, Pid)>;
    using CompletionHandler = std::function<void(boost::system::error_code)>;

    virtual ~Host() = default;

    /// @brief Executor that runs completion handlers and event delivery
    virtual auto get_executor() -> boost::asio::any_io_executor = 0;

    /**
     * @brief Start a process
     *
     * On success the handler receives the new pid, and only after that
     * are events pushed through the channel. On failure nothing is ever
     * sent on the channel.
     *
     * @param request program, arguments and options
     * @param channel destination of the process's events
     * @param handler completion handler, never invoked from inside this call
     */
    virtual auto execute_process(SpawnRequest request, Channel channel, SpawnHandler handler) -> void = 0;

    /// @brief Write to the standard input of a process
    virtual auto write_stdin(Pid pid, Buffer buffer, CompletionHandler handler) -> void = 0;

    /// @brief Request termination of a process
    virtual auto kill_process(Pid pid, CompletionHandler handler) -> void = 0;
};

namespace detail {

/**
 * @brief Adapt a move-only completion handler to a copyable function
 *
 * The resulting function must be called exactly once. The handler runs
 * on its associated executor, defaulting to the given fallback.
 *
 * @tparam Args completion signature arguments
 * @param handler completion handler from async_initiate
 * @param fallback executor used when the handler has none
 */
template <typename... Args, typename Handler>
auto share_handler(Handler&& handler, boost::asio::any_io_executor const& fallback) -> std::function<void(Args...)>
{
    auto const executor = boost::asio::get_associated_executor(handler, fallback);
    auto const shared = std::make_shared<std::decay_t<Handler>>(std::forward<Handler>(handler));
    return [shared, executor](Args... args) {
        boost::asio::dispatch(executor, [shared, ... args = std::move(args)]() mutable {
            std::move(*shared)(std::move(args)...);
        });
    };
}

} // namespace detail

} // namespace procshell
