#include "mz/service/music_service.hpp"

#include "mz/core/errors.hpp"

#include <sstream>

namespace mz::music {

music_service::music_service(std::shared_ptr<const resolve::resolution_pipeline> pipeline,
                             session::session_registry& sessions,
                             std::shared_ptr<playlist_store> playlists,
                             std::shared_ptr<stream::stream_preparer> preparer,
                             stream::download_writer downloader,
                             logger log)
    : m_pipeline(std::move(pipeline))
    , m_sessions(sessions)
    , m_playlists(std::move(playlists))
    , m_preparer(std::move(preparer))
    , m_downloader(std::move(downloader))
    , m_log(std::move(log))
{
}

std::shared_ptr<music_service::guild_lane> music_service::lane_for(dpp::snowflake guild)
{
    std::lock_guard<std::mutex> lock(m_lanes_mutex);
    auto& lane = m_lanes[static_cast<std::uint64_t>(guild)];
    if (!lane) {
        lane = std::make_shared<guild_lane>();
    }
    return lane;
}

enqueue_result music_service::resolve_and_enqueue(dpp::snowflake guild, const play_request& req, bool start)
{
    auto lane = lane_for(guild);

    session::command_sequencer::ticket ticket = 0;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(lane->control);
        ticket = lane->seq.reserve();
        epoch  = lane->epoch;
    }

    track_ptr t;
    try {
        t = m_pipeline->resolve(req.query, req.provider, req.requested_quality);
    } catch (const std::exception&) {
        lane->seq.release(ticket);
        throw;
    }

    enqueue_result result;
    result.item = t;
    lane->seq.apply(ticket, [&] {
        std::lock_guard<std::mutex> lock(lane->control);
        if (lane->retired || lane->epoch != epoch) {
            std::ostringstream oss;
            oss << "Guild " << guild.str() << ": dropping '" << t->title << "', resolved after a stop or skip";
            m_log.log(dpp::ll_info, oss.str());
            throw request_cancelled(req.query);
        }

        auto s = m_sessions.get_or_create(guild);
        if (start) {
            const auto out = s->enqueue_and_play(t, req.position);
            result.index   = out.index;
            result.started = out.started;
        } else {
            result.index = s->enqueue(t, req.position);
        }
    });

    std::ostringstream oss;
    oss << "Guild " << guild.str() << ": queued '" << t->title << "' at " << result.index
        << (result.started ? " and started" : "");
    m_log.log(dpp::ll_info, oss.str());
    return result;
}

enqueue_result music_service::play(dpp::snowflake guild, const play_request& req)
{
    return resolve_and_enqueue(guild, req, true);
}

enqueue_result music_service::enqueue(dpp::snowflake guild, const play_request& req)
{
    return resolve_and_enqueue(guild, req, false);
}

bool music_service::pause(dpp::snowflake guild)
{
    auto s = m_sessions.find(guild);
    return s && s->pause();
}

bool music_service::resume(dpp::snowflake guild)
{
    auto s = m_sessions.find(guild);
    return s && s->resume();
}

bool music_service::skip(dpp::snowflake guild)
{
    auto lane = lane_for(guild);
    std::lock_guard<std::mutex> lock(lane->control);
    ++lane->epoch;
    auto s = m_sessions.find(guild);
    return s && s->skip();
}

void music_service::stop(dpp::snowflake guild)
{
    auto lane = lane_for(guild);
    std::lock_guard<std::mutex> lock(lane->control);
    ++lane->epoch;
    if (auto s = m_sessions.find(guild)) {
        s->stop();
    }
}

void music_service::clear_queue(dpp::snowflake guild)
{
    if (auto s = m_sessions.find(guild)) {
        s->clear_queue();
    }
}

queue_snapshot music_service::get_queue(dpp::snowflake guild) const
{
    auto s = m_sessions.find(guild);
    return s ? s->queue() : queue_snapshot{};
}

track_ptr music_service::get_now_playing(dpp::snowflake guild) const
{
    auto s = m_sessions.find(guild);
    return s ? s->now_playing() : nullptr;
}

void music_service::set_loop_mode(dpp::snowflake guild, loop_mode mode)
{
    m_sessions.get_or_create(guild)->set_loop_mode(mode);
}

bool music_service::toggle_shuffle(dpp::snowflake guild)
{
    return m_sessions.get_or_create(guild)->toggle_shuffle();
}

int music_service::set_volume(dpp::snowflake guild, int percent)
{
    return m_sessions.get_or_create(guild)->set_volume(percent);
}

track_ptr music_service::remove(dpp::snowflake guild, std::size_t index)
{
    auto s = m_sessions.find(guild);
    if (!s) {
        throw index_out_of_range(index, 0);
    }
    return s->remove_at(index);
}

void music_service::move(dpp::snowflake guild, std::size_t from, std::size_t to)
{
    auto s = m_sessions.find(guild);
    if (!s) {
        throw index_out_of_range(from, 0);
    }
    s->reorder(from, to);
}

void music_service::playlist_create(dpp::snowflake owner, const std::string& name)
{
    m_playlists->create(owner, name);
}

std::size_t music_service::playlist_add(dpp::snowflake owner, const std::string& name, const play_request& req)
{
    // Resolve first so a bad query never creates an empty playlist
    auto t = m_pipeline->resolve(req.query, req.provider, req.requested_quality);
    return m_playlists->add(owner, name, std::move(t));
}

std::size_t music_service::playlist_play(dpp::snowflake guild, dpp::snowflake owner, const std::string& name)
{
    const auto tracks = m_playlists->tracks(owner, name);
    if (tracks.empty()) {
        throw error("playlist '" + name + "' is empty");
    }

    auto lane = lane_for(guild);
    lane->seq.apply(lane->seq.reserve(), [&] {
        std::lock_guard<std::mutex> lock(lane->control);
        if (lane->retired) {
            throw request_cancelled(name);
        }
        m_sessions.get_or_create(guild)->enqueue_all(tracks, true);
    });
    return tracks.size();
}

std::vector<std::string> music_service::playlist_list(dpp::snowflake owner) const
{
    return m_playlists->list(owner);
}

bool music_service::playlist_delete(dpp::snowflake owner, const std::string& name)
{
    return m_playlists->remove(owner, name);
}

void music_service::playlist_rename(dpp::snowflake owner, const std::string& from, const std::string& to)
{
    m_playlists->rename(owner, from, to);
}

stream::temp_file music_service::download(const std::string& query, std::optional<provider_id> provider, quality q)
{
    const auto t = m_pipeline->resolve(query, provider, q);
    const auto handle = m_preparer->prepare(t);

    try {
        auto file = m_downloader.write(*handle, t->title);
        handle->close();
        return file;
    } catch (const std::exception&) {
        handle->close();
        throw;
    }
}

void music_service::disconnect(dpp::snowflake guild)
{
    std::shared_ptr<guild_lane> lane;
    {
        std::lock_guard<std::mutex> lock(m_lanes_mutex);
        auto it = m_lanes.find(static_cast<std::uint64_t>(guild));
        if (it != m_lanes.end()) {
            lane = it->second;
            m_lanes.erase(it);
        }
    }

    if (!lane) {
        m_sessions.remove(guild);
        return;
    }

    // Resolutions still holding this lane find it retired and drop their result
    std::lock_guard<std::mutex> lock(lane->control);
    lane->retired = true;
    ++lane->epoch;
    m_sessions.remove(guild);
}

} // namespace mz::music
