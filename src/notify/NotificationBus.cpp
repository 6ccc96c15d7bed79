#include "aegis/notify/NotificationBus.hpp"

#include <algorithm>
#include <iostream>

namespace aegis {

NotificationBus::NotificationBus(const Clock& clock, size_t history)
    : clock_(clock), history_limit_(history) {}

NotificationBus::SubscriptionId
NotificationBus::subscribe(Handler handler, std::set<NotificationType> filter) {
    std::lock_guard<std::mutex> lock(mtx_);
    SubscriptionId id = next_id_++;
    subs_.push_back({id, std::move(handler), std::move(filter)});
    return id;
}

void NotificationBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mtx_);
    subs_.erase(
        std::remove_if(subs_.begin(), subs_.end(),
                       [id](const Subscription& s) { return s.id == id; }),
        subs_.end());
}

void NotificationBus::publish(NotificationType type,
                              const std::string& source,
                              const std::string& message,
                              nlohmann::json payload) {
    Notification n;
    n.type = type;
    n.source = source;
    n.message = message;
    n.payload = std::move(payload);
    publish(std::move(n));
}

void NotificationBus::publish(Notification n) {
    if (n.ts_ns == 0) n.ts_ns = clock_.wall_ns();

    std::vector<Subscription> targets;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        history_.push_back(n);
        while (history_.size() > history_limit_) history_.pop_front();

        for (const auto& s : subs_) {
            if (s.filter.empty() || s.filter.count(n.type)) {
                targets.push_back(s);
            }
        }
    }

    for (const auto& s : targets) {
        try {
            s.handler(n);
        } catch (const std::exception& e) {
            std::cerr << "[NOTIFY] Subscriber " << s.id << " failed on "
                      << notification_type_to_string(n.type) << ": " << e.what() << "\n";
        }
    }
}

std::vector<Notification> NotificationBus::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = std::min(limit, history_.size());
    return std::vector<Notification>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

} // namespace aegis
