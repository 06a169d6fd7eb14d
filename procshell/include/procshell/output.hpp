#pragma once
/**
 * @file output.hpp
 * @brief Folding streamed output chunks into a final result
 *
 */

#include "buffer.hpp"
#include "options.hpp"

#include <optional>
#include <span>
#include <string>

namespace procshell {

/// @brief Join lines with a single newline separator, no trailing newline
auto collect_text(std::span<Buffer const> chunks) -> std::string;

/// @brief Concatenate chunks, each followed by one newline byte
auto collect_raw(std::span<Bytes const> chunks) -> Bytes;

/**
 * @brief Fold output chunks according to an encoding
 *
 * Text encoding produces a string, raw encoding produces bytes. Chunks
 * of the other representation are converted before folding.
 *
 * @param encoding collection policy
 * @param chunks received chunks in arrival order
 * @return Buffer folded result
 */
auto collect_output(Encoding encoding, std::span<Buffer const> chunks) -> Buffer;

/// @brief Aggregate result of a completed process
struct ExecOutput
{
    std::optional<int> code;
    std::optional<int> signal;
    Buffer stdout_data;
    Buffer stderr_data;

    friend auto operator==(ExecOutput const&, ExecOutput const&) -> bool = default;
};

} // namespace procshell
