#include "mz/util/worker_pool.hpp"

#include <exception>
#include <stdexcept>

namespace mz::util {

worker_pool::worker_pool(std::size_t threads, logger log)
    : m_log(std::move(log))
{
    if (threads == 0) {
        threads = 1;
    }
    m_threads.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        m_threads.emplace_back([this] { run(); });
    }
}

worker_pool::~worker_pool()
{
    shutdown();
}

void worker_pool::post(task t)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            throw std::runtime_error("worker pool is shutting down");
        }
        m_tasks.push_back(std::move(t));
    }
    m_cv.notify_one();
}

executor_fn worker_pool::executor()
{
    return [this](task t) { post(std::move(t)); };
}

void worker_pool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_threads.empty()) {
            return;
        }
        m_stopping = true;
    }
    m_cv.notify_all();

    for (auto& t : m_threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    m_threads.clear();
}

void worker_pool::run()
{
    for (;;) {
        task next;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
            if (m_tasks.empty()) {
                return; // stopping and drained
            }
            next = std::move(m_tasks.front());
            m_tasks.pop_front();
        }

        try {
            next();
        } catch (const std::exception& e) {
            m_log.log(dpp::ll_error, std::string("Unhandled exception in worker task: ") + e.what());
        }
    }
}

} // namespace mz::util
