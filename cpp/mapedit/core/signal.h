#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

// Synchronous multicast notification. Listeners removed while the signal is being
// raised are not invoked afterwards; listeners added while raising are not invoked
// until the next raise.
template <typename... Args>
class Signal {
public:
    using Listener = std::function<void(Args...)>;
    using ListenerId = std::uint32_t;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    ListenerId addListener(Listener listener) {
        const ListenerId id = nextId_++;
        listeners_.push_back({id, std::move(listener)});
        return id;
    }

    bool removeListener(ListenerId id) {
        const auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const Entry& e) {
            return e.id == id;
        });
        if (it == listeners_.end()) return false;
        listeners_.erase(it);
        return true;
    }

    // Returns a closure removing the listener; the signal must outlive the closure call.
    std::function<void()> connect(Listener listener) {
        const ListenerId id = addListener(std::move(listener));
        return [this, id]() { removeListener(id); };
    }

    void raise(Args... args) {
        if (listeners_.empty()) return;
        const std::vector<Entry> snapshot = listeners_;
        for (const Entry& entry : snapshot) {
            if (!isConnected(entry.id)) continue;
            entry.listener(args...);
        }
    }

    void clear() { listeners_.clear(); }
    std::size_t listenerCount() const { return listeners_.size(); }
    bool empty() const { return listeners_.empty(); }

private:
    struct Entry {
        ListenerId id;
        Listener listener;
    };

    bool isConnected(ListenerId id) const {
        for (const Entry& e : listeners_) {
            if (e.id == id) return true;
        }
        return false;
    }

    std::vector<Entry> listeners_;
    ListenerId nextId_ = 1;
};
