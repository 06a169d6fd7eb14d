#pragma once
/**
 * @file child.hpp
 * @brief Capability to feed and terminate a spawned process
 *
 */

#include "buffer.hpp"
#include "host.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/system/error_code.hpp>

namespace procshell {

/**
 * @brief Handle to a live process addressed by its pid
 *
 * Both operations complete as soon as the host accepted the request.
 * Failures are reported to the caller of that operation only and do
 * not affect the event stream of the process.
 */
class Child
{
public:
    using Signature = void(boost::system::error_code);

private:
    Host* host_;
    Pid pid_;

    auto start_write(Buffer data, Host::CompletionHandler handler) const -> void;
    auto start_kill(Host::CompletionHandler handler) const -> void;
    auto checked_host() const -> Host&;

public:
    /// @brief Placeholder for failed spawns; using it throws std::logic_error
    Child() noexcept
        : host_{nullptr}
        , pid_{0}
    {
    }

    Child(Host& host, Pid const pid) noexcept
        : host_{&host}
        , pid_{pid}
    {
    }

    auto pid() const noexcept -> Pid
    {
        return pid_;
    }

    /**
     * @brief Write text or bytes to the standard input of the process
     *
     * Completes once the host took the data, not when the process
     * consumed it.
     *
     * @param data text or bytes, delivered unchanged
     * @param token completion token
     */
    template <boost::asio::completion_token_for<Signature> CompletionToken>
    auto async_write(Buffer data, CompletionToken&& token) const
    {
        return boost::asio::async_initiate<CompletionToken, Signature>(
            [self = *this](auto handler, Buffer data) {
                self.start_write(std::move(data), detail::share_handler<boost::system::error_code>(std::move(handler), self.checked_host().get_executor()));
            },
            token, std::move(data));
    }

    /**
     * @brief Ask the host to terminate the process
     *
     * Success means the request was accepted. The exit itself is
     * reported by the close event of the command that spawned it.
     *
     * @param token completion token
     */
    template <boost::asio::completion_token_for<Signature> CompletionToken>
    auto async_kill(CompletionToken&& token) const
    {
        return boost::asio::async_initiate<CompletionToken, Signature>(
            [self = *this](auto handler) {
                self.start_kill(detail::share_handler<boost::system::error_code>(std::move(handler), self.checked_host().get_executor()));
            },
            token);
    }
};

} // namespace procshell
