#include "procshell/errors.hpp"

namespace procshell {

ShellErrCategory const theShellErrCategory;

char const* ShellErrCategory::name() const noexcept
{
    return "procshell";
}

std::string ShellErrCategory::message(int ev) const
{
    switch (static_cast<ShellErrc>(ev))
    {
    case ShellErrc::Succeeded:
        return "succeeded";
    case ShellErrc::ProgramNotAllowed:
        return "program not allowed on the configured scope";
    case ShellErrc::SidecarNotAllowed:
        return "sidecar not allowed on the configured scope";
    case ShellErrc::ProgramNotFound:
        return "program not found";
    case ShellErrc::UnknownEncoding:
        return "unknown character encoding";
    case ShellErrc::ChildClosed:
        return "child process input is closed";
    default:
        return "(unrecognized error)";
    }
}

auto make_error_code(ShellErrc const err) -> boost::system::error_code
{
    return boost::system::error_code{int(err), theShellErrCategory};
}

} // namespace procshell
