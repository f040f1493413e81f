#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace fetcher {

class Download;

enum class EventKind {
    queue,
    activate,
    progress,
    complete,
    fail,
    // Follows `fail`; listeners read the cause from Download::error().
    error,
    pause,
    unpause,
    remove,
    done,
};

inline constexpr std::size_t kEventKindCount = 10;

[[nodiscard]] const char* toString(EventKind kind) noexcept;

using SubscriptionId = std::uint64_t;

// Minimal observer list. Slots may connect or disconnect while an emit is in
// progress; a slot disconnected mid-emit is not called afterwards.
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;

    SubscriptionId connect(Slot slot) {
        const SubscriptionId id = ++last_id_;
        slots_.push_back({id, std::make_shared<Slot>(std::move(slot))});
        return id;
    }

    bool disconnect(SubscriptionId id) {
        const auto it = std::find_if(slots_.begin(), slots_.end(),
                                     [id](const Entry& entry) { return entry.id == id; });
        if (it == slots_.end()) {
            return false;
        }
        slots_.erase(it);
        return true;
    }

    void emit(Args... args) const {
        const auto snapshot = slots_;
        for (const auto& entry : snapshot) {
            if (!connected(entry.id)) {
                continue;
            }
            (*entry.slot)(args...);
        }
    }

    [[nodiscard]] bool connected(SubscriptionId id) const {
        return std::any_of(slots_.begin(), slots_.end(),
                           [id](const Entry& entry) { return entry.id == id; });
    }

    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }

    void clear() noexcept { slots_.clear(); }

private:
    struct Entry {
        SubscriptionId id;
        std::shared_ptr<Slot> slot;
    };

    std::vector<Entry> slots_;
    SubscriptionId last_id_{0};
};

// Listeners keyed by EventKind. Every event carries the record it concerns.
class EventHub {
public:
    using Listener = std::function<void(const Download&)>;

    SubscriptionId on(EventKind kind, Listener listener);
    bool off(SubscriptionId id);

    void emit(EventKind kind, const Download& download) const;

    [[nodiscard]] std::size_t listenerCount(EventKind kind) const noexcept;

private:
    struct Route {
        SubscriptionId id;
        EventKind kind;
        SubscriptionId slot;
    };

    std::array<Signal<const Download&>, kEventKindCount> signals_{};
    std::vector<Route> routes_;
    SubscriptionId last_id_{0};
};

} // namespace fetcher
