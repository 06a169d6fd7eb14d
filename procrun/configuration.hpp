#pragma once
/**
 * @file configuration.hpp
 * @brief Command-line configuration of procrun
 *
 */

#include <procshell/options.hpp>

#include <string>
#include <vector>

struct configuration
{
    /// Encoding of the child's output
    procshell::Encoding encoding;

    /// Character set label of text output, or null for UTF-8
    char const* charset;

    /// Resolve the program next to this executable
    bool sidecar;

    /// Stream output and forward stdin instead of collecting
    bool interactive;

    /// Start from an empty environment
    bool clear_environment;

    /// Working directory of the child, or the current one when null
    char const* cwd;

    /// Lua script run in place of a program
    char const* lua_filename;

    /// Variables added to the child's environment, as NAME=VALUE
    std::vector<std::string> environment;

    /// Programs in the host's allow-list
    std::vector<std::string> allowed;

    /// Program followed by its arguments, or script arguments with -L
    std::vector<std::string> command;
};

configuration load_configuration(int argc, char** argv);
