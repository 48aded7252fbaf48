#pragma once

#include <functional>
#include <string>
#include <utility>

#include <dpp/misc-enum.h>

namespace mz {

using log_fn = std::function<void(dpp::loglevel, const std::string&)>;

/// Forwards to whatever the owner wires in (cluster.log in the bot, nothing in tests).
class logger {
public:
    logger() = default;
    explicit logger(log_fn fn) : m_fn(std::move(fn)) {}

    void log(dpp::loglevel level, const std::string& msg) const {
        if (m_fn) {
            m_fn(level, msg);
        }
    }

private:
    log_fn m_fn;
};

} // namespace mz
