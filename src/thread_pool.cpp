#include "thread_pool.hpp"
#include "string_utils.hpp"
#include "log.hpp"

#include <exception>

namespace flume {

inline int auto_concurrency()
{
    return std::max(2, int(2 * std::thread::hardware_concurrency()));
}

thread_pool::thread_pool() : thread_pool(auto_concurrency()) {}

thread_pool::thread_pool(int concurrency)
    : concurrency_(concurrency <= 0 ? 2 : concurrency)
{}

thread_pool::~thread_pool()
{
    join();
}

int thread_pool::num_threads() const
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    return threads_.size();
}

int thread_pool::num_pending_jobs() const
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    return job_queue_.size();
}

int thread_pool::num_executed_jobs() const noexcept
{
    return num_executed_jobs_.load(std::memory_order_relaxed);
}

void thread_pool::post(job_type job)
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    if(is_joining_) {
        return;
    }
    job_queue_.emplace_back(std::move(job));
    if(num_idle_threads_ == 0 && int(threads_.size()) < concurrency_) {
        threads_.emplace_back([this] { run(); });
    } else {
        job_available_.notify_one();
    }
}

void thread_pool::clear_pending_jobs()
{
    std::lock_guard<std::mutex> l(job_queue_mutex_);
    job_queue_.clear();
}

void thread_pool::join()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> l(job_queue_mutex_);
        is_joining_ = true;
        threads.swap(threads_);
    }
    job_available_.notify_all();
    for(auto& thread : threads) {
        if(thread.joinable()) {
            thread.join();
        }
    }
}

void thread_pool::run()
{
    std::unique_lock<std::mutex> l(job_queue_mutex_);
    while(true) {
        ++num_idle_threads_;
        // wake up if thread pool is being joined or a new job is available
        job_available_.wait(l, [this] { return is_joining_ || !job_queue_.empty(); });
        --num_idle_threads_;

        // queued jobs are always drained before exiting, even when joining
        if(job_queue_.empty()) {
            break;
        }

        auto job = std::move(job_queue_.front());
        job_queue_.pop_front();
        l.unlock();

        try {
            job();
        } catch(const std::exception& e) {
            log::log_engine("THREAD_POOL",
                    util::format("job terminated with exception: %s", e.what()),
                    log::priority::high);
        }
        num_executed_jobs_.fetch_add(1, std::memory_order_relaxed);

        l.lock();
    }
}

} // namespace flume
