#pragma once
/**
 * @file options.hpp
 * @brief Spawn options and the request sent to the host
 *
 */

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace procshell {

/// How stdout and stderr are delivered and collected
enum class Encoding
{
    /// lines arrive as strings and are joined with newlines
    Text,
    /// lines arrive as bytes and are concatenated with newline terminators
    Raw,
};

struct SpawnOptions
{
    /// Working directory of the child; unset inherits ours
    std::optional<std::filesystem::path> cwd;

    /// @brief Environment additions
    ///
    /// An engaged map inherits the host environment and adds these
    /// variables. A disengaged value clears the environment.
    std::optional<std::map<std::string, std::string>> env {std::in_place};

    Encoding encoding {Encoding::Text};

    /// @brief Label of the character set of text output, such as "windows-1252"
    ///
    /// Unset means the output must be valid UTF-8. Ignored for raw output.
    std::optional<std::string> charset;

    /// Program is a bundled executable instead of a PATH lookup
    bool sidecar {false};

    friend auto operator==(SpawnOptions const&, SpawnOptions const&) -> bool = default;
};

/// @brief Snapshot of a command taken when a spawn begins
struct SpawnRequest
{
    std::string program;
    std::vector<std::string> args;
    SpawnOptions options;
};

} // namespace procshell
