#include "prochost/linebuffer.hpp"

#include <algorithm>
#include <iterator>

namespace prochost {

auto LineBuffer::next_line() -> std::optional<std::string_view>
{
    if (skip_newline_ && start_ < end_)
    {
        skip_newline_ = false;
        if ('\n' == buffer_[start_])
        {
            search_ = ++start_;
        }
    }

    auto const first = std::next(buffer_.begin(), search_);
    auto const last = std::next(buffer_.begin(), end_);
    auto const eol = std::find_if(first, last, [](char const c) { return '\n' == c || '\r' == c; });

    if (eol == last) // no terminator found, line incomplete
    {
        search_ = end_;
        return std::nullopt;
    }

    auto const pos = static_cast<std::size_t>(std::distance(buffer_.begin(), eol));
    auto const line = std::string_view{buffer_.data() + start_, pos - start_};
    skip_newline_ = '\r' == *eol;
    start_ = search_ = pos + 1;
    return line;
}

auto LineBuffer::take_rest() -> std::optional<std::string_view>
{
    if (start_ == end_)
    {
        return std::nullopt;
    }

    auto const line = std::string_view{buffer_.data() + start_, end_ - start_};
    start_ = search_ = end_;
    skip_newline_ = false;
    return line;
}

auto LineBuffer::shift() -> void
{
    if (start_ != 0) // relocate incomplete line to front of buffer
    {
        std::copy(std::next(buffer_.begin(), start_), std::next(buffer_.begin(), end_), buffer_.begin());
        end_ -= start_;
        search_ -= start_;
        start_ = 0;
    }
}

} // namespace prochost
