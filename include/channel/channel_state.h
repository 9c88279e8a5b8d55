#pragma once

#include <cstddef>
#include <functional>
#include <map>

enum class ChannelState {
    NotConnected,
    Loading,
    Connected,
};

const char* to_string(ChannelState state);

/**
 * Holds the current ChannelState and tells subscribers about every set().
 *
 * Repeated values are reported too, so a retry cycle shows up as
 * Loading -> Loading.
 */
class StateNotifier {
public:
    using Listener = std::function<void(ChannelState)>;

    explicit StateNotifier(ChannelState initial = ChannelState::NotConnected) : value_(initial) {}

    [[nodiscard]] ChannelState value() const { return value_; }

    void set(ChannelState state);

    /// Returns an id for unsubscribe().
    std::size_t subscribe(Listener listener);
    void unsubscribe(std::size_t id);

private:
    ChannelState value_;
    std::map<std::size_t, Listener> listeners_;
    std::size_t next_id_ = 0;
};
