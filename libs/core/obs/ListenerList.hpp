#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include "Log.hpp"

using ListenerId = uint64_t;

// Process-wide, so ids from different lists never collide.
inline ListenerId nextListenerId() {
    static std::atomic<ListenerId> counter{0};
    return ++counter;
}

// Registration-ordered callbacks. emit() runs a snapshot, so listeners may add/remove during dispatch.
// A throwing listener is logged and does not stop the others.
template <class... Args>
class ListenerList {
public:
    using Listener = std::function<void(Args...)>;

    ListenerId add(Listener fn) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const ListenerId id = nextListenerId();
        m_listeners.emplace_back(id, std::move(fn));
        return id;
    }

    bool remove(ListenerId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == m_listeners.end()) return false;
        m_listeners.erase(it);
        return true;
    }

    void emit(const Args&... args) const {
        std::vector<std::pair<ListenerId, Listener>> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_listeners;
        }
        for (const auto& [id, fn] : snapshot) {
            try {
                fn(args...);
            } catch (const std::exception& e) {
                LOG_E("obs", "listener {} threw: {}", id, e.what());
            }
        }
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_listeners.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<ListenerId, Listener>> m_listeners;
};
