#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "mz/log.hpp"

namespace mz::util {

using task = std::function<void()>;

/// Hands a task to some thread. Sessions only ever see this, so tests can
/// run work inline or step it by hand.
using executor_fn = std::function<void(task)>;

/// Fixed set of threads draining a FIFO of tasks.
class worker_pool {
public:
    explicit worker_pool(std::size_t threads, logger log = {});
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    void post(task t);

    /// Executor that posts into this pool. The pool must outlive it.
    executor_fn executor();

    /// Stops accepting work, drains what is queued and joins.
    void shutdown();

private:
    void run();

    logger                   m_log;
    std::mutex               m_mutex;
    std::condition_variable  m_cv;
    std::deque<task>         m_tasks;
    std::vector<std::thread> m_threads;
    bool                     m_stopping = false;
};

} // namespace mz::util
