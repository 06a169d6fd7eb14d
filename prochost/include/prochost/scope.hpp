#pragma once
/**
 * @file scope.hpp
 * @brief Allow-list of programs the local host may start
 *
 */

#include <string>
#include <string_view>
#include <vector>

namespace prochost {

class Scope
{
    std::vector<std::string> programs_;
    std::vector<std::string> sidecars_;

public:
    /// @brief Allow a program by name (looked up on PATH) or by path
    auto allow_program(std::string program) -> Scope&;

    /// @brief Allow a bundled executable by its name relative to our own directory
    auto allow_sidecar(std::string sidecar) -> Scope&;

    auto allows_program(std::string_view program) const -> bool;

    /**
     * @brief Test whether a sidecar may run
     *
     * A sidecar entry matches the requested name either exactly or
     * with the file extension of the requested name removed.
     *
     * @param sidecar requested sidecar name
     */
    auto allows_sidecar(std::string_view sidecar) const -> bool;

    auto empty() const -> bool
    {
        return programs_.empty() && sidecars_.empty();
    }
};

} // namespace prochost
