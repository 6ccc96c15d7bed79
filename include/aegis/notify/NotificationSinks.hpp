#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include "aegis/notify/NotificationBus.hpp"

namespace aegis {

// Appends every notification it receives to a JSON-lines file.
class JournalSink {
public:
    explicit JournalSink(const std::string& path);

    void attach(NotificationBus& bus);
    void on_notification(const Notification& n);

    uint64_t written() const { return written_.load(); }

private:
    std::string path_;
    std::mutex mtx_;
    std::atomic<uint64_t> written_{0};
};

// ---------------------------------------------------------------------------
// POSTs notifications as JSON to an HTTP endpoint.
//
// The bus handler only enqueues; a single worker thread does the curl call
// so a slow endpoint never stalls the publisher. When the queue is full the
// oldest pending message is dropped and counted.
// ---------------------------------------------------------------------------
class WebhookSink {
public:
    WebhookSink(std::string url, size_t max_queue = 512, long timeout_sec = 3);
    ~WebhookSink();

    WebhookSink(const WebhookSink&) = delete;
    WebhookSink& operator=(const WebhookSink&) = delete;

    void attach(NotificationBus& bus);
    void on_notification(const Notification& n);

    void start();
    void stop();

    uint64_t sent() const { return sent_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void run();
    bool post(const std::string& body);

    const std::string url_;
    const size_t max_queue_;
    const long timeout_sec_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<uint64_t> sent_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace aegis
