#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <dpp/snowflake.h>

#include "mz/log.hpp"
#include "mz/session/session_engine.hpp"

namespace mz::session {

using session_ptr = std::shared_ptr<session_engine>;
using session_factory = std::function<session_ptr(dpp::snowflake guild)>;

/// Guild id -> live session. Owned by whoever wires the bot together and
/// passed down explicitly.
class session_registry {
public:
    session_registry(session_factory factory, std::chrono::seconds idle_timeout, logger log = {});

    session_ptr get_or_create(dpp::snowflake guild);
    session_ptr find(dpp::snowflake guild) const;

    /// Stops and forgets the guild's session. False if there was none.
    bool remove(dpp::snowflake guild);

    /// Drops sessions that are not playing and have seen no command for
    /// longer than the idle timeout. Returns the guilds removed.
    std::vector<dpp::snowflake> reap_idle(session_engine::clock::time_point now);

    std::size_t size() const;
    std::vector<dpp::snowflake> guilds() const;

private:
    session_factory      m_factory;
    std::chrono::seconds m_idle_timeout;
    logger               m_log;

    mutable std::mutex                 m_mutex;
    std::map<dpp::snowflake, session_ptr> m_sessions;
};

} // namespace mz::session
