#include "threadmanager.h"
#include <system_error>

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace rtcdrop {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
    LOG_THREAD_DEBUG("ThreadManager initialized");
}

ThreadManager::~ThreadManager() {
    // Ensure all threads are properly cleaned up
    join_all_active_threads();
    LOG_THREAD_DEBUG("ThreadManager destroyed");
}

bool ThreadManager::start_managed_thread(const std::string& name, std::function<void()> fn) {
    // Don't add new threads during shutdown
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Not starting thread during shutdown: " << name);
        return false;
    }

    // Reap whatever has already finished so long-running owners don't accumulate threads
    cleanup_finished_threads();

    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    // Double-check after acquiring lock
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Not starting thread during shutdown (double-check): " << name);
        return false;
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    ManagedThread managed;
    managed.name = name;
    managed.finished = finished;
    managed.thread = std::thread([name, fn = std::move(fn), finished]() {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Managed thread '" << name << "' terminated by exception: " << e.what());
        }
        finished->store(true);
    });

    active_threads_.push_back(std::move(managed));
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

void ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        auto it = active_threads_.begin();
        while (it != active_threads_.end()) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& managed : finished_threads) {
        join_or_detach(managed);
    }
}

void ThreadManager::shutdown_all_threads() {
    LOG_THREAD_DEBUG("Initiating shutdown of all background threads");

    // Set shutdown flag first
    shutdown_requested_.store(true);

    // Notify all waiting threads to wake up immediately
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;

    // Move threads out of the container while holding the lock
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }

        LOG_THREAD_DEBUG("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    // Join threads without holding the mutex
    for (auto& managed : threads_to_join) {
        join_or_detach(managed);
    }

    LOG_THREAD_DEBUG("All managed threads have been cleaned up");
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

void ThreadManager::notify_shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    shutdown_cv_.notify_all();
}

void ThreadManager::join_or_detach(ManagedThread& managed) {
    if (!managed.thread.joinable()) {
        return;
    }

    // A managed thread tearing down its own owner cannot join itself
    if (managed.thread.get_id() == std::this_thread::get_id()) {
        LOG_THREAD_DEBUG("Detaching self-joining thread: " << managed.name);
        managed.thread.detach();
        return;
    }

    try {
        managed.thread.join();
    } catch (const std::system_error& e) {
        LOG_THREAD_ERROR("Exception while joining thread " << managed.name << ": " << e.what());
    }
}

} // namespace rtcdrop
