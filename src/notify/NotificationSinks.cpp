#include "aegis/notify/NotificationSinks.hpp"
#include "aegis/infra/Errors.hpp"

#include <fstream>
#include <iostream>

#include <curl/curl.h>

namespace aegis {

// ---------------------------------------------------------------------------
// JournalSink
// ---------------------------------------------------------------------------

JournalSink::JournalSink(const std::string& path)
    : path_(path) {}

void JournalSink::attach(NotificationBus& bus) {
    bus.subscribe([this](const Notification& n) { on_notification(n); });
}

void JournalSink::on_notification(const Notification& n) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[NOTIFY] Cannot open journal " << path_ << "\n";
        return;
    }
    f << to_json_record(n).dump() << "\n";
    written_++;
}

// ---------------------------------------------------------------------------
// WebhookSink
// ---------------------------------------------------------------------------

static size_t discard_cb(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

WebhookSink::WebhookSink(std::string url, size_t max_queue, long timeout_sec)
    : url_(std::move(url)), max_queue_(max_queue), timeout_sec_(timeout_sec) {
    if (url_.empty()) throw InvalidArgument("webhook url is empty");
}

WebhookSink::~WebhookSink() {
    stop();
}

void WebhookSink::attach(NotificationBus& bus) {
    bus.subscribe([this](const Notification& n) { on_notification(n); });
}

void WebhookSink::on_notification(const Notification& n) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (queue_.size() >= max_queue_) {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(to_json_record(n).dump());
    }
    cv_.notify_one();
}

void WebhookSink::start() {
    if (running_.exchange(true)) return;
    curl_global_init(CURL_GLOBAL_ALL);
    worker_ = std::thread(&WebhookSink::run, this);
    std::cout << "[NOTIFY] Webhook sink started -> " << url_ << "\n";
}

void WebhookSink::stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
    curl_global_cleanup();
    std::cout << "[NOTIFY] Webhook sink stopped (sent=" << sent_.load()
              << " failed=" << failed_.load()
              << " dropped=" << dropped_.load() << ")\n";
}

void WebhookSink::run() {
    while (true) {
        std::string body;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });
            if (queue_.empty()) return;  // stopping and drained
            body = std::move(queue_.front());
            queue_.pop_front();
        }

        if (post(body)) sent_++;
        else failed_++;
    }
}

bool WebhookSink::post(const std::string& body) {
    CURL* c = curl_easy_init();
    if (!c) return false;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(c, CURLOPT_URL,            url_.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_TIMEOUT,        timeout_sec_);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 2L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL,       1L);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION,  discard_cb);

    CURLcode res = curl_easy_perform(c);
    long http_code = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(c);

    if (res != CURLE_OK) {
        std::cerr << "[NOTIFY] Webhook POST failed: " << curl_easy_strerror(res) << "\n";
        return false;
    }
    if (http_code < 200 || http_code >= 300) {
        std::cerr << "[NOTIFY] Webhook returned HTTP " << http_code << "\n";
        return false;
    }
    return true;
}

} // namespace aegis
