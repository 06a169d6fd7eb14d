#include "procshell/output.hpp"

#include <vector>

namespace procshell {

auto collect_text(std::span<Buffer const> const chunks) -> std::string
{
    std::string result;
    auto first = true;
    for (auto const& chunk : chunks)
    {
        if (not first)
        {
            result.push_back('\n');
        }
        first = false;
        result += as_text(chunk);
    }
    return result;
}

auto collect_raw(std::span<Bytes const> const chunks) -> Bytes
{
    Bytes result;
    for (auto const& chunk : chunks)
    {
        result.insert(result.end(), chunk.begin(), chunk.end());
        result.push_back('\n');
    }
    return result;
}

auto collect_output(Encoding const encoding, std::span<Buffer const> const chunks) -> Buffer
{
    switch (encoding)
    {
    case Encoding::Raw:
    {
        std::vector<Bytes> bytes;
        bytes.reserve(chunks.size());
        for (auto const& chunk : chunks)
        {
            bytes.push_back(as_bytes(chunk));
        }
        return collect_raw(bytes);
    }
    case Encoding::Text:
    default:
        return collect_text(chunks);
    }
}

} // namespace procshell
