#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

namespace aegis {

// ---------------------------------------------------------------------------
// Runs independent periodic jobs on a Boost.Asio thread pool.
//
// One pool thread per task so a slow job never delays another. Each task has
// its own strand and timer; the timer is re-armed only after the handler
// returns, so a task never overlaps itself. A handler that throws is logged
// and counted, and the task keeps its schedule.
//
// Tasks are registered before start(). stop() cancels every timer, waits for
// running handlers, and joins the pool.
// ---------------------------------------------------------------------------
class PeriodicScheduler {
public:
    using Job = std::function<void()>;

    PeriodicScheduler() = default;
    ~PeriodicScheduler();

    PeriodicScheduler(const PeriodicScheduler&) = delete;
    PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

    void add_task(const std::string& name, std::chrono::milliseconds interval, Job job);

    void start();
    void stop();

    bool running() const { return running_.load(); }

    uint64_t runs(const std::string& name) const;
    uint64_t failures(const std::string& name) const;

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    struct Task {
        std::string name;
        std::chrono::milliseconds interval;
        Job job;

        std::unique_ptr<Strand> strand;
        std::unique_ptr<boost::asio::steady_timer> timer;

        std::atomic<uint64_t> runs{0};
        std::atomic<uint64_t> failures{0};
    };

    void arm(Task& t);
    void fire(Task& t);
    const Task* find(const std::string& name) const;

    std::vector<std::unique_ptr<Task>> tasks_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<bool> running_{false};
};

} // namespace aegis
