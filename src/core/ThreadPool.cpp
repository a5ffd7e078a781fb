#include "ThreadPool.h"
#include "Cancellation.h"
#include "Logging.h"
#include <atomic>
#include <system_error>
#include <algorithm>

namespace plug_scan {

ThreadPool::ThreadPool(size_t threads){
    if(threads == 0) threads = 1;
    workers_.reserve(threads);
    for(size_t i=0;i<threads;++i){
        try {
            workers_.emplace_back([this]{ worker_loop(); });
        } catch(const std::system_error& ex) {
            Logger::instance().warn("thread pool: started " + std::to_string(workers_.size()) + "/" + std::to_string(threads) + " workers: " + ex.what());
            break;
        }
    }
    if(workers_.empty()) throw ResourceError("unable to start any worker thread");
}

ThreadPool::~ThreadPool(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    for(auto& t : workers_) if(t.joinable()) t.join();
}

void ThreadPool::submit(std::function<void()> task){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    work_cv_.notify_one();
}

void ThreadPool::worker_loop(){
    for(;;){
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [&]{ return stopping_ || !queue_.empty(); });
            if(queue_.empty()) return; // stopping and drained
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }
        try {
            task();
        } catch(const std::exception& ex) {
            Logger::instance().error(std::string("worker task failed: ") + ex.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
            if(queue_.empty() && running_ == 0) idle_cv_.notify_all();
        }
    }
}

void ThreadPool::wait_idle(){
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [&]{ return queue_.empty() && running_ == 0; });
}

bool ThreadPool::wait_idle_until(std::chrono::steady_clock::time_point deadline){
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_until(lock, deadline, [&]{ return queue_.empty() && running_ == 0; });
}

bool ThreadPool::idle(){
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty() && running_ == 0;
}

size_t parallel_for(size_t count, size_t max_workers, const std::function<void(size_t)>& fn, const CancelToken* token){
    if(count == 0) return 0;
    if(max_workers == 0) max_workers = 1;
    std::atomic<size_t> next{0};
    std::atomic<size_t> dispatched{0};
    auto loop = [&]{
        for(;;){
            if(token && token->cancelled()) return;
            size_t i = next.fetch_add(1);
            if(i >= count) return;
            dispatched.fetch_add(1);
            fn(i);
        }
    };
    {
        ThreadPool pool(std::min(count, max_workers));
        for(size_t w=0; w<pool.size(); ++w) pool.submit(loop);
        pool.wait_idle();
    }
    return dispatched.load();
}

}
