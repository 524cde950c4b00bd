#pragma once

/// @file signal.hpp
/// @brief Thread-safe Signal<Args...> for observer-style notifications.
///
/// Slots are registered with connect() (fire on every emit) or connectOnce()
/// (detached automatically before their first and only invocation). Emission
/// snapshots the slots under the lock and invokes them outside it, so a
/// slot may connect or disconnect without deadlocking.

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lcs::foundation {

/// Thread-safe signal dispatching events to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<LobbyId> destroyed;
///   destroyed.connectOnce([&](LobbyId id) { registry.remove(id); });
///   destroyed.emit(7);   // slot runs and is detached
///   destroyed.emit(7);   // no slots left; nothing happens
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    // Non-copyable, non-movable: slots capture the address of their owner.
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// Register a callback fired on every emit().
    SlotId connect(Slot slot) { return insert(std::move(slot), false); }

    /// Register a callback that is detached before it runs for the first time.
    SlotId connectOnce(Slot slot) { return insert(std::move(slot), true); }

    /// Remove a previously registered callback. Unknown ids are ignored.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        slots_.erase(id);
    }

    /// Remove every registered callback.
    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.clear();
    }

    /// Fire the signal, invoking every registered slot with the given args.
    void emit(Args... args) {
        std::vector<Slot> snapshot;
        {
            std::unique_lock lock(mutex_);
            snapshot.reserve(slots_.size());
            for (auto it = slots_.begin(); it != slots_.end();) {
                snapshot.push_back(it->second.callback);
                if (it->second.once) {
                    it = slots_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_.size();
    }

private:
    struct Entry {
        Slot callback;
        bool once = false;
    };

    SlotId insert(Slot slot, bool once) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        slots_.emplace(id, Entry{std::move(slot), once});
        return id;
    }

    std::unordered_map<SlotId, Entry> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace lcs::foundation
