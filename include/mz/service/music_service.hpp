#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "mz/core/play_queue.hpp"
#include "mz/core/playlist_store.hpp"
#include "mz/core/track.hpp"
#include "mz/log.hpp"
#include "mz/resolve/pipeline.hpp"
#include "mz/session/command_sequencer.hpp"
#include "mz/session/session_registry.hpp"
#include "mz/stream/download.hpp"
#include "mz/stream/stream_preparer.hpp"

namespace mz::music {

struct play_request {
    std::string                query;
    std::optional<provider_id> provider;
    std::optional<std::size_t> position;
    quality                    requested_quality = quality::high;
};

struct enqueue_result {
    track_ptr   item;
    std::size_t index   = 0;
    bool        started = false;
};

/// Everything the front end can ask for, per guild. Calls that resolve a
/// query block the calling thread on the network but hold no session lock
/// while doing so; their queue changes land in the order the calls began.
class music_service {
public:
    music_service(std::shared_ptr<const resolve::resolution_pipeline> pipeline,
                  session::session_registry& sessions,
                  std::shared_ptr<playlist_store> playlists,
                  std::shared_ptr<stream::stream_preparer> preparer,
                  stream::download_writer downloader,
                  logger log = {});

    // ---------- playback ----------

    /// Resolves and queues the track; starts it right away when the guild is idle.
    /// A stop, skip or disconnect for the guild while the query is still
    /// resolving drops the result with request_cancelled.
    enqueue_result play(dpp::snowflake guild, const play_request& req);
    enqueue_result enqueue(dpp::snowflake guild, const play_request& req);

    bool pause(dpp::snowflake guild);
    bool resume(dpp::snowflake guild);
    bool skip(dpp::snowflake guild);
    void stop(dpp::snowflake guild);

    // ---------- queue ----------

    void clear_queue(dpp::snowflake guild);
    queue_snapshot get_queue(dpp::snowflake guild) const;
    track_ptr get_now_playing(dpp::snowflake guild) const;
    void set_loop_mode(dpp::snowflake guild, loop_mode mode);
    bool toggle_shuffle(dpp::snowflake guild);
    int set_volume(dpp::snowflake guild, int percent);
    track_ptr remove(dpp::snowflake guild, std::size_t index);
    void move(dpp::snowflake guild, std::size_t from, std::size_t to);

    // ---------- playlists ----------

    void playlist_create(dpp::snowflake owner, const std::string& name);
    std::size_t playlist_add(dpp::snowflake owner, const std::string& name, const play_request& req);

    /// Copies the playlist onto the end of the guild queue. Returns the
    /// number of tracks added.
    std::size_t playlist_play(dpp::snowflake guild, dpp::snowflake owner, const std::string& name);

    std::vector<std::string> playlist_list(dpp::snowflake owner) const;
    bool playlist_delete(dpp::snowflake owner, const std::string& name);
    void playlist_rename(dpp::snowflake owner, const std::string& from, const std::string& to);

    // ---------- other ----------

    /// Resolves and writes the whole stream to a temp file. No session involved.
    stream::temp_file download(const std::string& query, std::optional<provider_id> provider, quality q);

    /// Voice connection gone: the guild's session is stopped and dropped.
    void disconnect(dpp::snowflake guild);

private:
    // Per-guild ordering and cancellation. `epoch` moves on every stop, skip
    // and disconnect; a resolution started under an older epoch is dropped.
    struct guild_lane {
        session::command_sequencer seq;
        std::mutex                 control; // taken before any session lock
        std::uint64_t              epoch   = 0;
        bool                       retired = false;
    };

    enqueue_result resolve_and_enqueue(dpp::snowflake guild, const play_request& req, bool start);
    std::shared_ptr<guild_lane> lane_for(dpp::snowflake guild);

    std::shared_ptr<const resolve::resolution_pipeline> m_pipeline;
    session::session_registry&                          m_sessions;
    std::shared_ptr<playlist_store>                     m_playlists;
    std::shared_ptr<stream::stream_preparer>            m_preparer;
    stream::download_writer                             m_downloader;
    logger                                              m_log;

    std::mutex                                          m_lanes_mutex;
    std::map<std::uint64_t, std::shared_ptr<guild_lane>> m_lanes;
};

} // namespace mz::music
