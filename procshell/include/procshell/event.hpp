#pragma once
/**
 * @file event.hpp
 * @brief Process lifecycle events pushed by the host
 *
 * A spawned process produces any number of Stdout and Stderr events
 * followed by exactly one terminal event: either Terminated or Error.
 */

#include "buffer.hpp"

#include <optional>
#include <string>
#include <variant>

namespace procshell {

namespace event {

/// One line of standard output
struct Stdout
{
    Buffer line;

    friend auto operator==(Stdout const&, Stdout const&) -> bool = default;
};

/// One line of standard error
struct Stderr
{
    Buffer line;

    friend auto operator==(Stderr const&, Stderr const&) -> bool = default;
};

/// Failure while the process was running, for example an I/O error
struct Error
{
    std::string message;

    friend auto operator==(Error const&, Error const&) -> bool = default;
};

/// @brief Process exit status
///
/// code is empty when the process was killed by a signal,
/// signal is empty on a normal exit.
struct Terminated
{
    std::optional<int> code;
    std::optional<int> signal;

    friend auto operator==(Terminated const&, Terminated const&) -> bool = default;
};

} // namespace event

using Event = std::variant<event::Stdout, event::Stderr, event::Error, event::Terminated>;

/// @brief Test if an event ends the event stream of its process
inline auto is_terminal(Event const& event) -> bool
{
    return std::holds_alternative<event::Error>(event)
        or std::holds_alternative<event::Terminated>(event);
}

} // namespace procshell
