#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <condition_variable>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace dragfit {

/* Fixed-size worker pool; 0 threads means one per hardware thread. */
class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /* f(0) … f(n-1), one task each; futures come back in index order */
    template <class F>
    auto enqueue_each(int n, F f)
        -> std::vector<std::future<std::invoke_result_t<F, int>>>;

private:
    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using Ret = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        if (stop_)
            throw std::runtime_error("ThreadPool: enqueue on a stopped pool");
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

template <class F>
auto ThreadPool::enqueue_each(int n, F f)
    -> std::vector<std::future<std::invoke_result_t<F, int>>>
{
    std::vector<std::future<std::invoke_result_t<F, int>>> out;
    out.reserve(n);
    for (int i = 0; i < n; ++i)
        out.push_back(enqueue(f, i));
    return out;
}

} // namespace dragfit
