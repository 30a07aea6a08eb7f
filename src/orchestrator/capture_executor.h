#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace TraceDiff {

/**
 * Fixed-size thread pool for concurrent captures.
 * Each task runs on a worker that blocks on its child's pipe; the result or
 * exception is delivered through the returned future.
 */
class CaptureExecutor {
public:
    explicit CaptureExecutor(size_t num_threads = 4);
    ~CaptureExecutor();

    CaptureExecutor(const CaptureExecutor&) = delete;
    CaptureExecutor& operator=(const CaptureExecutor&) = delete;

    template<typename Callback>
    auto ExecuteAsync(Callback&& callback) -> std::future<decltype(callback())> {
        using ReturnType = decltype(callback());

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::forward<Callback>(callback));
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("CaptureExecutor is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    // Drains queued tasks, then joins the workers.
    void Stop();

    size_t num_threads() const { return workers_.size(); }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace TraceDiff
