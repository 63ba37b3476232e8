#ifndef FLUME_THREAD_POOL_HEADER
#define FLUME_THREAD_POOL_HEADER

#include <condition_variable>
#include <functional>
#include <thread>
#include <atomic>
#include <vector>
#include <deque>
#include <mutex>

namespace flume {

/**
 * Runs blocking work (piece hashing, disk writes, stream reads waiting for pieces)
 * off the network threads. Threads are spun up lazily as jobs arrive, up to the
 * concurrency limit.
 */
class thread_pool
{
public:
    using job_type = std::function<void()>;

private:
    // Guarded by job_queue_mutex_ as jobs may be posted from any thread.
    std::vector<std::thread> threads_;

    // Threads are notified of new jobs via this condition variable while they are
    // holding onto job_queue_mutex_.
    std::condition_variable job_available_;

    // NOTE: must only be handled after acquiring job_queue_mutex_.
    std::deque<job_type> job_queue_;

    mutable std::mutex job_queue_mutex_;

    bool is_joining_ = false;
    int num_idle_threads_ = 0;
    std::atomic<int> num_executed_jobs_{0};

    int concurrency_;

public:
    /**
     * If the number of threads is not specified, it is calculated as a function of the
     * number of cores of the underlying hardware.
     */
    thread_pool();
    explicit thread_pool(int concurrency);
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    int num_threads() const;
    int num_pending_jobs() const;
    int num_executed_jobs() const noexcept;
    int concurrency() const noexcept { return concurrency_; }

    /**
     * Post a callable job to thread pool for execution at an unspecified time. If there
     * is an idle thread, the job is executed immediately, if not, a new thread might be
     * spun up if the concurrency limit is not reached, otherwise it is queued up for
     * later execution. Jobs posted after `join` are dropped.
     */
    void post(job_type job);

    /** Removes all jobs that are queued up. Does not affect currently executing jobs. */
    void clear_pending_jobs();

    /** Waits for all queued jobs to finish and stops all threads. */
    void join();

private:
    void run();
};

} // namespace flume

#endif // FLUME_THREAD_POOL_HEADER
