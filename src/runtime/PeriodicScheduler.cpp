#include "aegis/runtime/PeriodicScheduler.hpp"

#include <iostream>

#include <boost/asio/post.hpp>

#include "aegis/infra/Errors.hpp"

namespace aegis {

PeriodicScheduler::~PeriodicScheduler() {
    stop();
}

void PeriodicScheduler::add_task(const std::string& name,
                                 std::chrono::milliseconds interval, Job job) {
    if (running_.load())
        throw InvalidState("scheduler already started, cannot add '" + name + "'");
    if (interval.count() <= 0)
        throw InvalidArgument("task '" + name + "' needs a positive interval");
    if (find(name))
        throw InvalidArgument("task '" + name + "' already registered");

    auto t = std::make_unique<Task>();
    t->name = name;
    t->interval = interval;
    t->job = std::move(job);
    tasks_.push_back(std::move(t));
}

void PeriodicScheduler::start() {
    if (running_.exchange(true)) return;
    if (tasks_.empty()) {
        std::cout << "[SCHED] No tasks registered\n";
        return;
    }

    pool_ = std::make_unique<boost::asio::thread_pool>(tasks_.size());

    for (auto& t : tasks_) {
        t->strand = std::make_unique<Strand>(pool_->get_executor());
        t->timer = std::make_unique<boost::asio::steady_timer>(*t->strand);
        boost::asio::post(*t->strand, [this, task = t.get()] { arm(*task); });
        std::cout << "[SCHED] " << t->name << " every "
                  << t->interval.count() << "ms\n";
    }
}

void PeriodicScheduler::stop() {
    if (!running_.exchange(false)) return;
    if (!pool_) return;

    // Cancellation goes through each task's strand so it never races a
    // handler that is re-arming the same timer.
    for (auto& t : tasks_) {
        boost::asio::post(*t->strand, [task = t.get()] { task->timer->cancel(); });
    }
    pool_->join();

    for (auto& t : tasks_) {
        t->timer.reset();
        t->strand.reset();
    }
    pool_.reset();
    std::cout << "[SCHED] Stopped\n";
}

void PeriodicScheduler::arm(Task& t) {
    if (!running_.load()) return;

    t.timer->expires_after(t.interval);
    t.timer->async_wait([this, &t](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (!running_.load()) return;
        fire(t);
        arm(t);
    });
}

void PeriodicScheduler::fire(Task& t) {
    try {
        t.job();
        t.runs.fetch_add(1);
    } catch (const std::exception& e) {
        t.failures.fetch_add(1);
        std::cerr << "[SCHED] Task " << t.name << " failed: " << e.what() << "\n";
    }
}

const PeriodicScheduler::Task* PeriodicScheduler::find(const std::string& name) const {
    for (const auto& t : tasks_) {
        if (t->name == name) return t.get();
    }
    return nullptr;
}

uint64_t PeriodicScheduler::runs(const std::string& name) const {
    const Task* t = find(name);
    return t ? t->runs.load() : 0;
}

uint64_t PeriodicScheduler::failures(const std::string& name) const {
    const Task* t = find(name);
    return t ? t->failures.load() : 0;
}

} // namespace aegis
