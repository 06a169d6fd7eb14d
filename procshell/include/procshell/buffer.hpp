#pragma once
/**
 * @file buffer.hpp
 * @brief Byte and text payloads exchanged with child processes
 *
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace procshell {

/// Process identifier assigned by the host on a successful spawn
using Pid = std::uint32_t;

using Bytes = std::vector<std::uint8_t>;

/// @brief Either text or a raw byte sequence.
///
/// Text-encoded commands exchange strings, raw-encoded commands
/// exchange bytes.
using Buffer = std::variant<std::string, Bytes>;

/**
 * @brief View any buffer as text
 *
 * Bytes are copied verbatim into the resulting string.
 *
 * @param buffer text or bytes
 * @return std::string textual copy
 */
auto as_text(Buffer const& buffer) -> std::string;

/**
 * @brief View any buffer as bytes
 *
 * Text is copied verbatim into the resulting byte sequence.
 *
 * @param buffer text or bytes
 * @return Bytes byte copy
 */
auto as_bytes(Buffer const& buffer) -> Bytes;

inline auto to_bytes(std::string_view const text) -> Bytes
{
    return Bytes(text.begin(), text.end());
}

} // namespace procshell
