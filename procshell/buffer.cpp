#include "procshell/buffer.hpp"

#include "procshell/overloaded.hpp"

namespace procshell {

using detail::overloaded;

auto as_text(Buffer const& buffer) -> std::string
{
    return std::visit(overloaded {
        [](std::string const& text) { return text; },
        [](Bytes const& bytes) { return std::string(bytes.begin(), bytes.end()); },
    }, buffer);
}

auto as_bytes(Buffer const& buffer) -> Bytes
{
    return std::visit(overloaded {
        [](std::string const& text) { return to_bytes(text); },
        [](Bytes const& bytes) { return bytes; },
    }, buffer);
}

} // namespace procshell
