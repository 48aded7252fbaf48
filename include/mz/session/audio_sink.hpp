#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <dpp/snowflake.h>

#include "mz/stream/stream_handle.hpp"

namespace mz::session {

class session_engine;

/// The way back from the sink. Carries the generation the stream was
/// started under, so a signal for a replaced stream is dropped by the engine.
class completion_token {
public:
    completion_token() = default;
    completion_token(std::weak_ptr<session_engine> engine, std::uint64_t generation);

    void complete() const;
    void fail(const std::string& reason) const;

    std::uint64_t generation() const { return m_generation; }

private:
    void signal(std::optional<std::string> failure) const;

    std::weak_ptr<session_engine> m_engine;
    std::uint64_t                 m_generation = 0;
};

/// Plays prepared streams into a guild's voice connection. Called with the
/// session lock held, so implementations must not block or call back into
/// the engine synchronously.
class audio_sink {
public:
    virtual ~audio_sink() = default;

    virtual void start(dpp::snowflake guild, const stream::stream_handle_ptr& handle, completion_token token) = 0;
    virtual void pause(dpp::snowflake guild, bool paused) = 0;
    virtual void stop(dpp::snowflake guild) = 0;

    /// Percent, 0 to 100. Applies to the current track and to later ones.
    virtual void set_volume(dpp::snowflake guild, int percent) = 0;
};

} // namespace mz::session
