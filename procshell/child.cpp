#include "procshell/child.hpp"

#include <stdexcept>
#include <utility>

namespace procshell {

auto Child::checked_host() const -> Host&
{
    if (nullptr == host_)
    {
        throw std::logic_error{"child handle is not attached to a process"};
    }
    return *host_;
}

auto Child::start_write(Buffer data, Host::CompletionHandler handler) const -> void
{
    checked_host().write_stdin(pid_, std::move(data), std::move(handler));
}

auto Child::start_kill(Host::CompletionHandler handler) const -> void
{
    checked_host().kill_process(pid_, std::move(handler));
}

} // namespace procshell
