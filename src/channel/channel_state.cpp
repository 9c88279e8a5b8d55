#include "channel/channel_state.h"

#include <vector>

const char* to_string(ChannelState state) {
    switch (state) {
        case ChannelState::NotConnected: return "notConnected";
        case ChannelState::Loading:      return "loading";
        case ChannelState::Connected:    return "connected";
    }
    return "unknown";
}

void StateNotifier::set(ChannelState state) {
    value_ = state;

    // Listeners may subscribe or unsubscribe while being notified.
    std::vector<Listener> snapshot;
    snapshot.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        snapshot.push_back(entry.second);
    }
    for (const auto& listener : snapshot) {
        listener(state);
    }
}

std::size_t StateNotifier::subscribe(Listener listener) {
    const auto id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void StateNotifier::unsubscribe(std::size_t id) {
    listeners_.erase(id);
}
