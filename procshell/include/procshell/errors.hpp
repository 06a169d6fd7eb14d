#pragma once
/**
 * @file errors.hpp
 * @brief Error codes and exceptions reported by process operations
 *
 */

#include <boost/system/error_code.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace procshell {

struct ShellErrCategory : boost::system::error_category
{
    char const* name() const noexcept override;
    std::string message(int) const override;
};

extern ShellErrCategory const theShellErrCategory;

enum class ShellErrc
{
    Succeeded = 0,
    // Spawn requests denied by the host
    ProgramNotAllowed = 1,
    SidecarNotAllowed,
    ProgramNotFound,
    UnknownEncoding,
    // Requests addressed to a child that can no longer take them
    ChildClosed,
};

auto make_error_code(ShellErrc err) -> boost::system::error_code;

/**
 * @brief Failure reported by the host after a process was started
 *
 * This carries the message of an Error event.
 */
class ProcessError : public std::runtime_error
{
public:
    explicit ProcessError(std::string const& message)
        : std::runtime_error{message}
    {
    }
};

} // namespace procshell

namespace boost::system {
template <>
struct is_error_code_enum<procshell::ShellErrc> : std::true_type {};
}
