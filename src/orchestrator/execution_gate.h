#pragma once

#include <mutex>
#include <shared_mutex>

namespace TraceDiff {

/**
 * Reader/writer gate over the OS process table.
 * Concurrent captures enter shared; a sequential trace enters exclusive for
 * both of its captures, so no other capture can appear in (or be affected
 * by) its process listing.
 */
class ExecutionGate {
public:
    ExecutionGate() = default;
    ExecutionGate(const ExecutionGate&) = delete;
    ExecutionGate& operator=(const ExecutionGate&) = delete;

    // Shared by every orchestrator in the process.
    static ExecutionGate& Global();

    std::shared_lock<std::shared_mutex> EnterConcurrent() {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    std::unique_lock<std::shared_mutex> EnterSequential() {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

private:
    std::shared_mutex mutex_;
};

} // namespace TraceDiff
