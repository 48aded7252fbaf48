#pragma once

// Executor that only queues. Tests decide when posted work runs, which makes
// races between preparation and skip/stop reproducible.

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "mz/util/worker_pool.hpp"

namespace mz::tests::fixtures {

class manual_executor {
public:
    mz::util::executor_fn executor() {
        auto state = m_state;
        return [state](mz::util::task t) {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->tasks.push_back(std::move(t));
        };
    }

    /// Runs the oldest task. False if nothing was queued.
    bool run_one() {
        mz::util::task t;
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            if (m_state->tasks.empty()) {
                return false;
            }
            t = std::move(m_state->tasks.front());
            m_state->tasks.pop_front();
        }
        t();
        return true;
    }

    /// Runs until the queue stays empty, including work posted along the way.
    std::size_t run_all() {
        std::size_t n = 0;
        while (run_one()) {
            ++n;
        }
        return n;
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->tasks.size();
    }

private:
    struct state {
        std::mutex                    mutex;
        std::deque<mz::util::task>    tasks;
    };

    std::shared_ptr<state> m_state = std::make_shared<state>();
};

} // namespace mz::tests::fixtures
