#include "mz/session/command_sequencer.hpp"

namespace mz::session {

command_sequencer::ticket command_sequencer::reserve()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_next_ticket++;
}

void command_sequencer::finish_locked(ticket t)
{
    m_finished.insert(t);
    while (!m_finished.empty() && *m_finished.begin() == m_serving) {
        m_finished.erase(m_finished.begin());
        ++m_serving;
    }
    m_cv.notify_all();
}

void command_sequencer::apply(ticket t, const std::function<void()>& fn)
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this, t] { return m_serving == t; });
    }

    try {
        fn();
    } catch (...) {
        std::lock_guard<std::mutex> lock(m_mutex);
        finish_locked(t);
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    finish_locked(t);
}

void command_sequencer::release(ticket t)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    finish_locked(t);
}

} // namespace mz::session
