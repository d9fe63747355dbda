#pragma once

#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <expected>
#include <functional>
#include <atomic>
#include <string>
#include <type_traits>

namespace net = boost::asio;

/**
 * Dedicated lane for CPU-bound work (password hashing).
 * Callers on the I/O threads co_await async_submit(); the coroutine resumes on
 * its own executor once the job finished, so no I/O thread ever blocks on it.
 */
class ThreadPool
{
public:
    explicit ThreadPool(size_t n_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<class Fn>
    auto async_submit(Fn fn) -> net::awaitable<std::expected<std::invoke_result_t<Fn&>, std::string>>
    {
        using Ret = std::invoke_result_t<Fn&>;

        if (!running)
        {
            co_return std::unexpected(std::string("ThreadPool stopped"));
        }

        pending.fetch_add(1, std::memory_order_relaxed);
        Ret ret = co_await net::co_spawn(pool_exec,
            [this, fn = std::move(fn)]() mutable -> net::awaitable<Ret>
            {
                pending.fetch_sub(1, std::memory_order_relaxed);
                co_return std::invoke(fn);
            },
            net::use_awaitable);

        co_return ret;
    }

    [[nodiscard]] net::any_io_executor get_executor() const { return pool_exec; }
    [[nodiscard]] size_t size() const { return workers.size(); }
    [[nodiscard]] bool is_running() const { return running; }
    // Jobs submitted but not yet picked up by a worker.
    [[nodiscard]] size_t queued() const { return pending.load(std::memory_order_relaxed); }

    // Lets queued jobs drain, then joins the workers. Later submissions fail.
    void stop();

private:
    net::io_context pool_ctx;
    net::executor_work_guard<net::io_context::executor_type> work_guard;
    std::vector<std::jthread> workers;
    std::atomic<bool> running{true};
    std::atomic<size_t> pending{0};

    net::any_io_executor pool_exec{pool_ctx.get_executor()};
};
