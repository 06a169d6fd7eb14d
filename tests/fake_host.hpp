#pragma once
/**
 * @file fake_host.hpp
 * @brief Scripted host recording requests for tests
 *
 * Spawn requests are accepted with increasing pids unless a denial is
 * configured. Tests push events through the channel of any accepted
 * request. Completions are posted to the io_context like a real host.
 */

#include <procshell/errors.hpp>
#include <procshell/host.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

class FakeHost final : public procshell::Host
{
public:
    struct Spawned
    {
        procshell::SpawnRequest request;
        procshell::Channel channel;
        procshell::Pid pid;
    };

    struct Write
    {
        procshell::Pid pid;
        procshell::Buffer data;
    };

private:
    boost::asio::io_context& io_context_;
    procshell::Pid next_pid_;

public:
    std::vector<Spawned> spawned;
    std::vector<procshell::SpawnRequest> denied;
    std::vector<Write> writes;
    std::vector<procshell::Pid> kills;

    /// Error for every following spawn request, if any
    std::optional<boost::system::error_code> deny;
    boost::system::error_code write_error;
    boost::system::error_code kill_error;

    explicit FakeHost(boost::asio::io_context& io_context)
        : io_context_{io_context}
        , next_pid_{100}
    {
    }

    auto get_executor() -> boost::asio::any_io_executor override
    {
        return io_context_.get_executor();
    }

    auto execute_process(procshell::SpawnRequest request, procshell::Channel channel, SpawnHandler handler) -> void override
    {
        if (deny)
        {
            denied.push_back(std::move(request));
            boost::asio::post(io_context_, [handler = std::move(handler), error = *deny]() {
                handler(error, 0);
            });
            return;
        }

        auto const pid = next_pid_++;
        spawned.push_back({std::move(request), std::move(channel), pid});
        boost::asio::post(io_context_, [handler = std::move(handler), pid]() {
            handler({}, pid);
        });
    }

    auto write_stdin(procshell::Pid const pid, procshell::Buffer buffer, CompletionHandler handler) -> void override
    {
        writes.push_back({pid, std::move(buffer)});
        boost::asio::post(io_context_, [handler = std::move(handler), error = write_error]() {
            handler(error);
        });
    }

    auto kill_process(procshell::Pid const pid, CompletionHandler handler) -> void override
    {
        kills.push_back(pid);
        boost::asio::post(io_context_, [handler = std::move(handler), error = kill_error]() {
            handler(error);
        });
    }

    /// @brief Push an event through the channel of the i-th accepted spawn
    auto send(std::size_t const i, procshell::Event const& event) -> bool
    {
        return spawned.at(i).channel.send(event);
    }
};
