#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace pdf_outline {

// Fixed-size worker pool for per-document jobs. Jobs share nothing but the
// queue; results and exceptions travel back through the returned futures.
class ThreadPool {
public:
    // 0 selects std::thread::hardware_concurrency()
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    size_t thread_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;

    std::mutex queue_mutex_;
    std::condition_variable job_available_;
    bool stopping_ = false;
};

template<typename F, typename... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto job = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = job->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        jobs_.emplace([job]() { (*job)(); });
    }
    job_available_.notify_one();
    return result;
}

} // namespace pdf_outline
