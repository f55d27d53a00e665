#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace twinboot {

// Small fixed-size worker pool. Tasks run in submission order per worker;
// exceptions thrown by a task travel to the caller through its future.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t threadCount = 1)
    {
        if (threadCount == 0) threadCount = 1;
        m_workers.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i)
            m_workers.emplace_back([this] { WorkerLoop(); });
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() { Shutdown(); }

    // Runs queued tasks to completion, then joins the workers. Idempotent.
    void Shutdown() noexcept
    {
        {
            std::lock_guard lk(m_mutex);
            if (m_stop) return;
            m_stop = true;
        }
        m_cv.notify_all();
        for (auto& t : m_workers)
            if (t.joinable()) t.join();
    }

    template<class F>
    auto Submit(F&& f) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard lk(m_mutex);
            if (m_stop)
                throw std::runtime_error("ThreadPool is stopping");
            m_tasks.emplace([task]() { (*task)(); });
        }
        m_cv.notify_one();
        return fut;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return m_workers.size(); }

private:
    void WorkerLoop()
    {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock lk(m_mutex);
                m_cv.wait(lk, [this] { return m_stop || !m_tasks.empty(); });
                if (m_stop && m_tasks.empty()) return;
                task = std::move(m_tasks.front());
                m_tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread>          m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex                        m_mutex;
    std::condition_variable           m_cv;
    bool                              m_stop = false;
};

} // namespace twinboot
