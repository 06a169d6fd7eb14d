#pragma once
/**
 * @file channel.hpp
 * @brief Host-to-caller delivery path for the events of one process
 *
 */

#include "event.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace procshell {

/**
 * @brief One-directional event channel bound to a single subscriber
 *
 * A channel is created for every spawn request. The host keeps a copy
 * and pushes the events of the spawned process through it. After the
 * first terminal event the channel closes: the subscriber is released
 * and every later send is dropped.
 *
 * Copies of a channel share the same underlying state.
 */
class Channel
{
public:
    using Subscriber = std::function<void(Event const&)>;

private:
    struct State
    {
        std::uint64_t id;
        Subscriber subscriber;
        bool closed;
    };

    std::shared_ptr<State> state_;

public:
    explicit Channel(Subscriber subscriber);

    /// @brief Opaque identifier, unique within this process
    auto id() const -> std::uint64_t
    {
        return state_->id;
    }

    auto is_closed() const -> bool
    {
        return state_->closed;
    }

    /**
     * @brief Deliver an event to the subscriber
     *
     * @param event event to deliver
     * @return true if the event was delivered, false if the channel was
     *         already closed by an earlier terminal event
     */
    auto send(Event const& event) const -> bool;
};

} // namespace procshell
