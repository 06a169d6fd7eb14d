#pragma once
/**
 * @file linebuffer.hpp
 * @brief Line splitting for process output streams
 *
 */

#include <boost/asio/buffer.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace prochost {

/**
 * @brief Fixed-size buffer with line-oriented extraction
 *
 * Lines end at a newline or a carriage return. A carriage return
 * immediately followed by a newline ends a single line. Terminators are
 * not part of the returned lines.
 */
class LineBuffer
{
    std::vector<char> buffer_;

    // [start_, end_) contains buffered data
    // [search_, end_) has not been scanned for a terminator yet
    // [end_, size) is available buffer space
    std::size_t start_;
    std::size_t search_;
    std::size_t end_;

    // previous line ended with '\r', a leading '\n' belongs to it
    bool skip_newline_;

public:
    /**
     * @brief Construct a new Line Buffer object
     *
     * @param n Buffer size, which is also the longest line delivered whole
     */
    explicit LineBuffer(std::size_t n)
        : buffer_(n)
        , start_{0}
        , search_{0}
        , end_{0}
        , skip_newline_{false}
    {
    }

    // returned lines point into the buffer
    LineBuffer(LineBuffer const&) = delete;
    LineBuffer(LineBuffer&&) = delete;
    auto operator=(LineBuffer const&) -> LineBuffer& = delete;
    auto operator=(LineBuffer&&) -> LineBuffer& = delete;

    /**
     * @brief Get the available buffer space
     *
     * @return boost::asio::mutable_buffer
     */
    auto prepare() -> boost::asio::mutable_buffer
    {
        return boost::asio::buffer(buffer_.data() + end_, buffer_.size() - end_);
    }

    /**
     * @brief Commit new buffer bytes
     *
     * @param n Bytes written to the last call of prepare
     */
    auto commit(std::size_t const n) -> void
    {
        end_ += n;
    }

    /**
     * @brief Return the next complete line in the buffer
     *
     * This function should be repeatedly called until it returns
     * nothing. After that shift can be used to reclaim the
     * previously used buffer.
     *
     * @return line or nullopt if no line is ready
     */
    auto next_line() -> std::optional<std::string_view>;

    /**
     * @brief Return all buffered bytes as a final unterminated line
     *
     * Used at end of stream and when a line does not fit the buffer.
     *
     * @return line or nullopt if nothing is buffered
     */
    auto take_rest() -> std::optional<std::string_view>;

    /**
     * @brief Reclaim used buffer space invalidating all previous
     * next_line() results
     */
    auto shift() -> void;

    /// @brief True when no buffer space remains
    auto full() const -> bool
    {
        return end_ == buffer_.size();
    }
};

} // namespace prochost
