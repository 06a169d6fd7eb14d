#pragma once
/**
 * @file local_host.hpp
 * @brief Host that runs processes on this machine
 *
 * Programs are started with Boost.Process on the given io_context.
 * Their stdout and stderr are split into lines and pushed through the
 * spawn request's channel, followed by a single terminal event once the
 * process exited and both streams are drained.
 */

#include "scope.hpp"

#include <procshell/host.hpp>

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <map>
#include <memory>

namespace prochost {

class LocalHost final : public procshell::Host
{
public:
    /// Size of the stdout and stderr line buffers
    static std::size_t const line_buffer_size = 65'536;

    struct Running;
    using Children = std::map<procshell::Pid, std::shared_ptr<Running>>;

private:
    boost::asio::io_context& io_context_;
    Scope scope_;
    std::shared_ptr<Children> children_;

public:
    LocalHost(boost::asio::io_context& io_context, Scope scope);
    ~LocalHost() override;

    LocalHost(LocalHost const&) = delete;
    LocalHost(LocalHost&&) = delete;
    auto operator=(LocalHost const&) -> LocalHost& = delete;
    auto operator=(LocalHost&&) -> LocalHost& = delete;

    auto get_executor() -> boost::asio::any_io_executor override;
    auto execute_process(procshell::SpawnRequest request, procshell::Channel channel, SpawnHandler handler) -> void override;
    auto write_stdin(procshell::Pid pid, procshell::Buffer buffer, CompletionHandler handler) -> void override;
    auto kill_process(procshell::Pid pid, CompletionHandler handler) -> void override;

    /// @brief Number of processes that have not delivered their terminal event
    auto running() const -> std::size_t
    {
        return children_->size();
    }

    auto get_scope() -> Scope&
    {
        return scope_;
    }
};

} // namespace prochost
