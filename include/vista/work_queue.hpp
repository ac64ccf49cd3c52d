#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace vista {

// A fixed set of worker threads draining one FIFO of tasks.
//
// With one worker this is a serial queue: tasks run one at a time in
// submission order. A task submitted from one of the queue's own workers runs
// inline on the spot, so a queued task may call back into operations that
// enqueue more work without deadlocking. Once shut down, submissions also run
// inline on the caller's thread.
class WorkQueue {
public:
    WorkQueue(size_t num_workers, std::string name);
    ~WorkQueue();

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    template<class F>
    auto submit(F&& f) -> std::shared_future<std::invoke_result_t<std::decay_t<F>>>;

    // Stop accepting queued work, run whatever is pending, join the workers.
    // Idempotent.
    void shutdown();

    bool on_worker_thread() const;
    bool is_stopped() const;
    size_t pending() const;
    size_t thread_count() const { return workers_.size(); }
    const std::string& name() const { return name_; }

private:
    void worker_loop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> worker_ids_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

template<class F>
auto WorkQueue::submit(F&& f)
    -> std::shared_future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::shared_future<R> result = task->get_future().share();

    bool inline_run = on_worker_thread();
    if (!inline_run) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            inline_run = true;
        } else {
            tasks_.emplace([task]() { (*task)(); });
        }
    }

    if (inline_run) {
        (*task)();
    } else {
        condition_.notify_one();
    }
    return result;
}

} // namespace vista
