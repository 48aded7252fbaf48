#pragma once

#include <string>

#include <dpp/snowflake.h>

#include "mz/core/track.hpp"

namespace mz::session {

enum class playback_state {
    idle,
    playing,
    paused,
    error
};

std::string to_string(playback_state s);

/// Outbound session events. Always called with no session lock held.
class session_listener {
public:
    virtual ~session_listener() = default;

    virtual void on_now_playing(dpp::snowflake guild, const track_ptr& t) = 0;
    virtual void on_track_error(dpp::snowflake guild, const track_ptr& t, const std::string& reason) = 0;
    virtual void on_queue_exhausted(dpp::snowflake guild) = 0;
    virtual void on_playback_failed(dpp::snowflake guild, const std::string& reason) = 0;
};

} // namespace mz::session
