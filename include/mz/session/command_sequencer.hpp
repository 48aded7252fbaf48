#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>

namespace mz::session {

/// Applies commands in the order their tickets were handed out, however
/// long each one took to get ready. A ticket must end in exactly one
/// apply() or release().
///
/// Take the ticket on the thread that goes on to apply it: a holder only
/// ever waits for lower tickets, and those are held by running threads.
class command_sequencer {
public:
    using ticket = std::uint64_t;

    ticket reserve();

    /// Blocks until every earlier ticket is done, then runs `fn`. The ticket
    /// is consumed even if `fn` throws.
    void apply(ticket t, const std::function<void()>& fn);

    /// Gives the turn up without applying anything.
    void release(ticket t);

private:
    void finish_locked(ticket t);

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    ticket                  m_next_ticket = 0;
    ticket                  m_serving     = 0;
    std::set<ticket>        m_finished;
};

} // namespace mz::session
