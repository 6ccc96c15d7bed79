#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "aegis/infra/Clock.hpp"
#include "aegis/notify/NotificationBus.hpp"

namespace aegis {
namespace test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> seq{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("aegis_test_" + std::to_string(stamp) + "_" + std::to_string(seq++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

// Collects every notification published on a bus.
class Recorder {
public:
    explicit Recorder(NotificationBus& bus) {
        bus.subscribe([this](const Notification& n) { seen.push_back(n); });
    }

    size_t count(NotificationType t) const {
        size_t n = 0;
        for (const auto& x : seen) if (x.type == t) n++;
        return n;
    }

    std::vector<Notification> seen;
};

} // namespace test
} // namespace aegis
