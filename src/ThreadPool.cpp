#include "mbbfit/ThreadPool.hpp"
#include <algorithm>

namespace mbbfit {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0)
        nthreads = std::max(1u, std::thread::hardware_concurrency());

    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

} // namespace mbbfit
