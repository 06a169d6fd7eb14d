#pragma once
/**
 * @file event_emitter.hpp
 * @brief Named-event publish/subscribe with synchronous fan-out
 *
 */

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace procshell {

/**
 * @brief Registry of listeners keyed by event name
 *
 * Listeners are invoked synchronously in registration order by emit.
 *
 * Fan-out walks the listener sequence that was registered when emit
 * started. Removing a listener replaces that sequence, so a listener
 * removed during fan-out can still be reached by the fan-out already in
 * progress, while listeners appended during fan-out are reached by it.
 * Self-removal by a once listener is the supported mutation pattern.
 *
 * @tparam Arg Payload type passed to every listener
 */
template <typename Arg>
class EventEmitter
{
public:
    using Callback = std::function<void(Arg const&)>;

    /**
     * @brief Callback with reference identity
     *
     * Copies of a Listener compare equal to each other and to nothing
     * else, so a Listener can be kept to unregister it later.
     */
    class Listener
    {
        friend class EventEmitter;

        std::shared_ptr<Callback const> callback_;

        explicit Listener(std::shared_ptr<Callback const> callback)
            : callback_{std::move(callback)}
        {
        }

    public:
        template <std::invocable<Arg const&> F>
        requires (not std::same_as<std::remove_cvref_t<F>, Listener>)
        Listener(F&& f)
            : callback_{std::make_shared<Callback const>(std::forward<F>(f))}
        {
        }

        auto operator()(Arg const& arg) const -> void
        {
            (*callback_)(arg);
        }

        friend auto operator==(Listener const&, Listener const&) -> bool = default;
    };

private:
    using Sequence = std::vector<Listener>;
    std::map<std::string, std::shared_ptr<Sequence>, std::less<>> listeners_;

    auto find(std::string_view const name) const -> std::shared_ptr<Sequence>
    {
        auto const it = listeners_.find(name);
        return it == listeners_.end() ? nullptr : it->second;
    }

    auto wrap_once(std::string_view const name, Listener listener) -> Listener
    {
        // The wrapper needs its own identity to unregister itself.
        // A weak reference avoids a cycle through the stored callback.
        auto const identity = std::make_shared<std::weak_ptr<Callback const>>();
        auto wrapper = Listener{[this, name = std::string{name}, identity, fired = false, listener = std::move(listener)](Arg const& arg) mutable {
            if (fired)
            {
                return;
            }
            fired = true;
            if (auto const self = identity->lock())
            {
                off(name, Listener{self});
            }
            listener(arg);
        }};
        *identity = wrapper.callback_;
        return wrapper;
    }

public:
    EventEmitter() = default;

    // listeners registered by once refer back to their emitter
    EventEmitter(EventEmitter const&) = delete;
    EventEmitter(EventEmitter&&) = delete;
    auto operator=(EventEmitter const&) -> EventEmitter& = delete;
    auto operator=(EventEmitter&&) -> EventEmitter& = delete;

    /// @brief Append a listener for the named event
    auto on(std::string_view const name, Listener listener) -> EventEmitter&
    {
        if (auto const sequence = find(name))
        {
            sequence->push_back(std::move(listener));
        }
        else
        {
            listeners_.emplace(name, std::make_shared<Sequence>(Sequence{std::move(listener)}));
        }
        return *this;
    }

    auto add_listener(std::string_view const name, Listener listener) -> EventEmitter&
    {
        return on(name, std::move(listener));
    }

    /// @brief Append a listener that unregisters itself before its first call
    auto once(std::string_view const name, Listener listener) -> EventEmitter&
    {
        return on(name, wrap_once(name, std::move(listener)));
    }

    /// @brief Insert a listener ahead of all existing listeners
    auto prepend_listener(std::string_view const name, Listener listener) -> EventEmitter&
    {
        if (auto const sequence = find(name))
        {
            sequence->insert(sequence->begin(), std::move(listener));
        }
        else
        {
            listeners_.emplace(name, std::make_shared<Sequence>(Sequence{std::move(listener)}));
        }
        return *this;
    }

    auto prepend_once_listener(std::string_view const name, Listener listener) -> EventEmitter&
    {
        return prepend_listener(name, wrap_once(name, std::move(listener)));
    }

    /// @brief Remove every registration of the given listener
    auto off(std::string_view const name, Listener const& listener) -> EventEmitter&
    {
        auto const it = listeners_.find(name);
        if (it != listeners_.end())
        {
            // Build a fresh sequence so that a fan-out in progress
            // keeps walking the old one.
            auto remaining = std::make_shared<Sequence>();
            for (auto const& l : *it->second)
            {
                if (l != listener)
                {
                    remaining->push_back(l);
                }
            }

            if (remaining->empty())
            {
                listeners_.erase(it);
            }
            else
            {
                it->second = std::move(remaining);
            }
        }
        return *this;
    }

    auto remove_listener(std::string_view const name, Listener const& listener) -> EventEmitter&
    {
        return off(name, listener);
    }

    auto remove_all_listeners() -> EventEmitter&
    {
        listeners_.clear();
        return *this;
    }

    auto remove_all_listeners(std::string_view const name) -> EventEmitter&
    {
        auto const it = listeners_.find(name);
        if (it != listeners_.end())
        {
            listeners_.erase(it);
        }
        return *this;
    }

    /**
     * @brief Invoke all listeners of the named event
     *
     * @param name event name
     * @param arg payload passed to each listener
     * @return true when at least one listener was registered
     */
    auto emit(std::string_view const name, Arg const& arg) -> bool
    {
        auto const sequence = find(name);
        if (not sequence)
        {
            return false;
        }

        // Index loop: listeners can append to the sequence while we walk it
        for (std::size_t i = 0; i < sequence->size(); ++i)
        {
            auto const listener = (*sequence)[i];
            listener(arg);
        }
        return true;
    }

    auto listener_count(std::string_view const name) const -> std::size_t
    {
        auto const sequence = find(name);
        return sequence ? sequence->size() : 0;
    }
};

} // namespace procshell
