#include <vista/work_queue.hpp>
#include <vista/log.hpp>

#include <algorithm>

namespace vista {

WorkQueue::WorkQueue(size_t num_workers, std::string name)
    : name_(std::move(name)) {
    num_workers = std::max(num_workers, static_cast<size_t>(1));

    // Hold the lock so no worker can observe a partially filled id list
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&WorkQueue::worker_loop, this);
        worker_ids_.push_back(workers_.back().get_id());
    }
    vista::log::trace("work queue '%s' started with %zu worker(s)",
                      name_.c_str(), num_workers);
}

WorkQueue::~WorkQueue() {
    shutdown();
}

void WorkQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();

    auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) continue;
        if (worker.get_id() == self) {
            // Shut down from inside one of our own tasks
            worker.detach();
        } else {
            worker.join();
        }
    }
    vista::log::trace("work queue '%s' stopped", name_.c_str());
}

bool WorkQueue::on_worker_thread() const {
    auto self = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(worker_ids_.begin(), worker_ids_.end(), self) != worker_ids_.end();
}

bool WorkQueue::is_stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

size_t WorkQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkQueue::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });

            // Drain before exiting
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (task) task();
    }
}

} // namespace vista
