#include "mz/session/session_registry.hpp"

#include <sstream>
#include <stdexcept>

namespace mz::session {

session_registry::session_registry(session_factory factory, std::chrono::seconds idle_timeout, logger log)
    : m_factory(std::move(factory))
    , m_idle_timeout(idle_timeout)
    , m_log(std::move(log))
{
}

session_ptr session_registry::get_or_create(dpp::snowflake guild)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(guild);
    if (it != m_sessions.end()) {
        return it->second;
    }

    auto s = m_factory(guild);
    if (!s) {
        throw std::runtime_error("session factory returned nothing for guild " + guild.str());
    }
    m_sessions.emplace(guild, s);
    m_log.log(dpp::ll_info, "Session " + guild.str() + ": created");
    return s;
}

session_ptr session_registry::find(dpp::snowflake guild) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(guild);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool session_registry::remove(dpp::snowflake guild)
{
    session_ptr s;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(guild);
        if (it == m_sessions.end()) {
            return false;
        }
        s = std::move(it->second);
        m_sessions.erase(it);
    }

    s->stop();
    m_log.log(dpp::ll_info, "Session " + guild.str() + ": destroyed");
    return true;
}

std::vector<dpp::snowflake> session_registry::reap_idle(session_engine::clock::time_point now)
{
    std::vector<session_ptr> reaped;
    std::vector<dpp::snowflake> guilds;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            const auto& s = it->second;
            if (!s->busy() && now - s->last_activity() > m_idle_timeout) {
                guilds.push_back(it->first);
                reaped.push_back(s);
                it = m_sessions.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (std::size_t i = 0; i < reaped.size(); ++i) {
        reaped[i]->stop();
        m_log.log(dpp::ll_info, "Session " + guilds[i].str() + ": reaped after idling");
    }
    return guilds;
}

std::size_t session_registry::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<dpp::snowflake> session_registry::guilds() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<dpp::snowflake> out;
    out.reserve(m_sessions.size());
    for (const auto& [guild, s] : m_sessions) {
        out.push_back(guild);
    }
    return out;
}

} // namespace mz::session
