#include "prochost/scope.hpp"

#include <algorithm>
#include <filesystem>

namespace prochost {

auto Scope::allow_program(std::string program) -> Scope&
{
    programs_.push_back(std::move(program));
    return *this;
}

auto Scope::allow_sidecar(std::string sidecar) -> Scope&
{
    sidecars_.push_back(std::move(sidecar));
    return *this;
}

auto Scope::allows_program(std::string_view const program) const -> bool
{
    return std::find(programs_.begin(), programs_.end(), program) != programs_.end();
}

auto Scope::allows_sidecar(std::string_view const sidecar) const -> bool
{
    auto const without_extension = std::filesystem::path{sidecar}.replace_extension().string();
    return std::ranges::any_of(sidecars_, [&](std::string const& entry) {
        return entry == sidecar || entry == without_extension;
    });
}

} // namespace prochost
