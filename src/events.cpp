#include "fetcher/events.hpp"

#include <utility>

namespace fetcher {

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::queue:    return "queue";
        case EventKind::activate: return "activate";
        case EventKind::progress: return "progress";
        case EventKind::complete: return "complete";
        case EventKind::fail:     return "fail";
        case EventKind::error:    return "error";
        case EventKind::pause:    return "pause";
        case EventKind::unpause:  return "unpause";
        case EventKind::remove:   return "remove";
        case EventKind::done:     return "done";
    }
    return "unknown";
}

SubscriptionId EventHub::on(EventKind kind, Listener listener) {
    const auto slot = signals_[static_cast<std::size_t>(kind)].connect(std::move(listener));
    const SubscriptionId id = ++last_id_;
    routes_.push_back({id, kind, slot});
    return id;
}

bool EventHub::off(SubscriptionId id) {
    const auto it = std::find_if(routes_.begin(), routes_.end(),
                                 [id](const Route& route) { return route.id == id; });
    if (it == routes_.end()) {
        return false;
    }
    signals_[static_cast<std::size_t>(it->kind)].disconnect(it->slot);
    routes_.erase(it);
    return true;
}

void EventHub::emit(EventKind kind, const Download& download) const {
    signals_[static_cast<std::size_t>(kind)].emit(download);
}

std::size_t EventHub::listenerCount(EventKind kind) const noexcept {
    return signals_[static_cast<std::size_t>(kind)].size();
}

} // namespace fetcher
