#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace rtcdrop {

/**
 * ThreadManager provides thread management capabilities for classes that need
 * to manage multiple background threads with graceful shutdown coordination.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    // Thread management methods
    /**
     * Run a function on a new managed thread
     * @param name Descriptive name for logging purposes
     * @param fn Thread body
     * @return false if shutdown was already requested and the thread was not started
     */
    bool start_managed_thread(const std::string& name, std::function<void()> fn);

    /**
     * Join threads that have finished execution, leaving running ones alone
     */
    void cleanup_finished_threads();

    /**
     * Signal all threads to shutdown and notify waiting threads
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish.
     * A thread calling this on its own manager is detached instead of joined.
     */
    void join_all_active_threads();

    /**
     * Get the current number of active threads
     * @return Number of active threads
     */
    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Condition variable for coordinating thread shutdown
     * Threads should wait on this and check running flags
     */
    std::condition_variable shutdown_cv_;

    /**
     * Mutex for the shutdown condition variable
     */
    std::mutex shutdown_mutex_;

    /**
     * Notify all waiting threads to wake up (typically for shutdown)
     */
    void notify_shutdown();

    /**
     * Clear the shutdown flag so the manager can start threads again
     */
    void reset_shutdown_flag() { shutdown_requested_.store(false); }

private:
    struct ManagedThread {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    static void join_or_detach(ManagedThread& managed);

    // Prevent copying
    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace rtcdrop
