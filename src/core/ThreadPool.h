#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <chrono>

namespace plug_scan {

class CancelToken;

// Raised when not a single worker thread could be started.
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& what) : std::runtime_error(what) {}
};

// Fixed-size worker pool. Tasks run in FIFO order; the destructor finishes queued work and joins.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void submit(std::function<void()> task);
    size_t size() const { return workers_.size(); }
    // Blocks until the queue is empty and no task is running.
    void wait_idle();
    // Same with a deadline; false if work remained when it passed.
    bool wait_idle_until(std::chrono::steady_clock::time_point deadline);
    bool idle();
private:
    void worker_loop();
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    size_t running_ = 0;
    bool stopping_ = false;
};

// Runs fn(i) for i in [0, count) on at most max_workers threads. Indices are handed out lazily;
// once token is cancelled no further index is dispatched and in-flight calls drain.
// Returns the number of indices dispatched.
size_t parallel_for(size_t count, size_t max_workers, const std::function<void(size_t)>& fn, const CancelToken* token = nullptr);

}
