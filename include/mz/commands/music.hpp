#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/dpp.h>

#include "mz/service/music_service.hpp"
#include "mz/session/events.hpp"
#include "mz/util/worker_pool.hpp"

namespace mz::music {

/// Posts session events to the text channel that last issued a command in
/// the guild.
class channel_announcer : public session::session_listener {
public:
    explicit channel_announcer(dpp::cluster& bot);

    void remember(dpp::snowflake guild, dpp::snowflake channel);
    void forget(dpp::snowflake guild);

    void on_now_playing(dpp::snowflake guild, const track_ptr& t) override;
    void on_track_error(dpp::snowflake guild, const track_ptr& t, const std::string& reason) override;
    void on_queue_exhausted(dpp::snowflake guild) override;
    void on_playback_failed(dpp::snowflake guild, const std::string& reason) override;

private:
    void post(dpp::snowflake guild, const std::string& text);

    dpp::cluster& m_bot;

    std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, dpp::snowflake> m_channels;
};

struct command_context {
    dpp::cluster&      bot;
    music_service&     service;
    channel_announcer& announcer;
    util::worker_pool& workers;
};

/// /play, /pause, /resume, /skip, /stop, /addtoqueue, /clearqueue, /queue,
/// /nowplaying, /loop, /shuffle, /volume, /remove, /move, /playlist, /download,
/// /leave
std::vector<dpp::slashcommand> make_commands(dpp::cluster& bot);

/// Dispatches a music slash command. Returns false for commands that are
/// not ours.
bool route_slashcommand(const dpp::slashcommand_t& ev, command_context& ctx);

/// Asks the gateway to take the bot out of the guild's voice channel.
/// Throws mz::error if the guild is not cached.
void leave_voice_channel(dpp::cluster& bot, dpp::snowflake guild);

/// Renders a queue snapshot for a reply, 1-based.
std::string format_queue(const queue_snapshot& snap, const track_ptr& now_playing);

} // namespace mz::music
