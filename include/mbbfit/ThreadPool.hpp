#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <functional>
#include <condition_variable>
#include <atomic>
#include <future>
#include <mutex>
#include <type_traits>

namespace mbbfit {

class ThreadPool {
public:
    /*  nthreads == 0  ->  hardware concurrency (at least one worker)       */
    explicit ThreadPool(unsigned nthreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    /*  Run f(0) … f(n-1) on the pool and block until all are done.
     *  Results come back in index order; the first exception is rethrown.  */
    template <class F>
    auto map(std::size_t n, F&& f)
        -> std::vector<std::invoke_result_t<F, std::size_t>>;

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
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

template <class F>
auto ThreadPool::map(std::size_t n, F&& f)
    -> std::vector<std::invoke_result_t<F, std::size_t>>
{
    using Ret = std::invoke_result_t<F, std::size_t>;
    std::vector<std::future<Ret>> pending;
    pending.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        pending.push_back(enqueue([&f, i]() { return f(i); }));

    // every task references f: let all of them finish before rethrowing
    for (auto& fut : pending) fut.wait();

    std::vector<Ret> out;
    out.reserve(n);
    for (auto& fut : pending) out.push_back(fut.get());
    return out;
}

} // namespace mbbfit
