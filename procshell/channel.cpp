#include "procshell/channel.hpp"

#include <atomic>
#include <utility>

namespace procshell {

namespace {
std::atomic<std::uint64_t> next_channel_id {1};
}

Channel::Channel(Subscriber subscriber)
    : state_{std::make_shared<State>(State{next_channel_id++, std::move(subscriber), false})}
{
}

auto Channel::send(Event const& event) const -> bool
{
    if (state_->closed)
    {
        return false;
    }

    if (is_terminal(event))
    {
        // Release the subscriber before delivery so that anything it
        // captured goes away with the process.
        state_->closed = true;
        auto const subscriber = std::move(state_->subscriber);
        state_->subscriber = nullptr;
        subscriber(event);
    }
    else
    {
        // a copy survives a terminal event sent from inside the subscriber
        auto const subscriber = state_->subscriber;
        subscriber(event);
    }
    return true;
}

} // namespace procshell
