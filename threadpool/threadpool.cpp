#include "threadpool/threadpool.hpp"
#include "logger.hpp"

#include <algorithm>

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
{
    n_threads = std::max<size_t>(n_threads, 1);
    workers.reserve(n_threads);
    for (size_t i = 0; i < n_threads; ++i)
    {
        workers.emplace_back([this] { pool_ctx.run(); });
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

void ThreadPool::stop()
{
    if (!running.exchange(false))
    {
        return;
    }

    if (auto left = queued(); left != 0)
    {
        LOG_DEBUG("Draining {} queued CPU jobs", left);
    }
    work_guard.reset();
    workers.clear();
}
