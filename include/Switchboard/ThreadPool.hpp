// =================================================================
// include/Switchboard/ThreadPool.hpp
// =================================================================
// Fixed-size worker pool shared by health probing and task execution.

#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace Switchboard {

/**
 * @brief Bounded pool of worker threads draining a FIFO job queue
 *
 * The destructor drains queued jobs before joining the workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        for (size_t i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] {
                while (true) {
                    std::function<void()> job;
                    {
                        std::unique_lock<std::mutex> lock(m_queue_mutex);
                        m_condition.wait(lock, [this] { return m_stop || !m_jobs.empty(); });

                        if (m_stop && m_jobs.empty()) {
                            return;
                        }

                        job = std::move(m_jobs.front());
                        m_jobs.pop();
                    }

                    job();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (std::thread& worker : m_workers) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable for execution
     * @return Future holding the callable's result or exception
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using return_type = std::invoke_result_t<F, Args...>;

        auto job = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> result = job->get_future();
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);

            if (m_stop) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }

            m_jobs.emplace([job]() { (*job)(); });
        }

        m_condition.notify_one();
        return result;
    }

    size_t size() const { return m_workers.size(); }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_jobs;

    std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_stop = false;
};

} // namespace Switchboard
