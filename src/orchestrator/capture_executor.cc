#include "capture_executor.h"

#include <glog/logging.h>

namespace TraceDiff {

CaptureExecutor::CaptureExecutor(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("CaptureExecutor needs at least one worker thread");
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&CaptureExecutor::WorkerThread, this);
    }
    VLOG(2) << "CaptureExecutor started " << num_threads << " workers";
}

CaptureExecutor::~CaptureExecutor() {
    Stop();
}

void CaptureExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void CaptureExecutor::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        task();
    }
}

} // namespace TraceDiff
