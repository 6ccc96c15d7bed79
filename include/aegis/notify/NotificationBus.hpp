#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/notify/Notification.hpp"

namespace aegis {

// ---------------------------------------------------------------------------
// Publish/subscribe channel for control-plane notifications.
//
// Publishers never hold their own locks while publishing. Handlers run on
// the publisher's thread, so a handler that does I/O must hand off to its
// own worker (see WebhookSink). A throwing handler is logged and skipped;
// it never fails the publisher.
// ---------------------------------------------------------------------------
class NotificationBus {
public:
    using Handler = std::function<void(const Notification&)>;
    using SubscriptionId = uint64_t;

    explicit NotificationBus(const Clock& clock, size_t history = 256);

    // Empty filter = all types.
    SubscriptionId subscribe(Handler handler, std::set<NotificationType> filter = {});
    void unsubscribe(SubscriptionId id);

    void publish(NotificationType type,
                 const std::string& source,
                 const std::string& message,
                 nlohmann::json payload = nlohmann::json::object());

    void publish(Notification n);

    std::vector<Notification> recent(size_t limit) const;

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
        std::set<NotificationType> filter;
    };

    const Clock& clock_;
    const size_t history_limit_;

    mutable std::mutex mtx_;
    std::vector<Subscription> subs_;
    std::deque<Notification> history_;
    SubscriptionId next_id_ = 1;
};

} // namespace aegis
