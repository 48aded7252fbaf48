#include "mz/session/session_engine.hpp"

#include "mz/core/errors.hpp"

#include <algorithm>
#include <sstream>

namespace mz::session {

std::string to_string(playback_state s)
{
    switch (s) {
        case playback_state::idle:    return "idle";
        case playback_state::playing: return "playing";
        case playback_state::paused:  return "paused";
        case playback_state::error:   return "error";
    }
    return "idle";
}

std::shared_ptr<session_engine> session_engine::create(dpp::snowflake guild,
                                                       engine_options opts,
                                                       std::shared_ptr<stream::stream_preparer> preparer,
                                                       std::shared_ptr<audio_sink> sink,
                                                       std::shared_ptr<session_listener> listener,
                                                       util::executor_fn executor,
                                                       logger log)
{
    return std::shared_ptr<session_engine>(new session_engine(guild, opts, std::move(preparer), std::move(sink),
                                                              std::move(listener), std::move(executor),
                                                              std::move(log)));
}

session_engine::session_engine(dpp::snowflake guild,
                               engine_options opts,
                               std::shared_ptr<stream::stream_preparer> preparer,
                               std::shared_ptr<audio_sink> sink,
                               std::shared_ptr<session_listener> listener,
                               util::executor_fn executor,
                               logger log)
    : m_guild(guild)
    , m_opts(opts)
    , m_preparer(std::move(preparer))
    , m_sink(std::move(sink))
    , m_listener(std::move(listener))
    , m_executor(std::move(executor))
    , m_log(std::move(log))
    , m_queue(opts.max_queue_size)
    , m_last_activity(clock::now())
{
}

void session_engine::run(deferred& after)
{
    for (auto& fn : after) {
        fn();
    }
    after.clear();
}

void session_engine::touch()
{
    m_last_activity = clock::now();
}

void session_engine::begin_prepare(deferred& after)
{
    const track_ptr t = m_queue.current();
    const std::uint64_t gen = ++m_generation;
    m_preparing = true;

    std::ostringstream oss;
    oss << "Session " << m_guild.str() << ": preparing '" << t->title << "' (generation " << gen << ")";
    m_log.log(dpp::ll_debug, oss.str());

    // Posted after unlock so an inline executor cannot deadlock
    auto self = shared_from_this();
    after.push_back([self, gen, t] {
        self->m_executor([self, gen, t] { self->run_prepare(gen, t); });
    });
}

void session_engine::run_prepare(std::uint64_t generation, track_ptr t)
{
    stream::stream_handle_ptr handle;
    std::optional<std::string> failure;
    try {
        handle = m_preparer->prepare(t);
        if (!handle) {
            failure = "no stream";
        }
    } catch (const stream_unavailable& e) {
        failure = e.what();
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_error, std::string("Session: preparer threw: ") + e.what());
        failure = e.what();
    }
    on_prepared(generation, std::move(t), std::move(handle), std::move(failure));
}

void session_engine::on_prepared(std::uint64_t generation, track_ptr t,
                                 stream::stream_handle_ptr handle, std::optional<std::string> failure)
{
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || !m_preparing) {
            std::ostringstream oss;
            oss << "Session " << m_guild.str() << ": dropping stale stream for '" << t->title
                << "' (generation " << generation << ", now " << m_generation << ")";
            m_log.log(dpp::ll_warning, oss.str());
            if (handle) {
                handle->close();
            }
            return;
        }
        m_preparing = false;

        if (!failure) {
            m_state       = playback_state::playing;
            m_handle      = handle;
            m_now_playing = t;
            m_attempts    = 0;
            m_sink->start(m_guild, handle, completion_token(weak_from_this(), generation));

            m_log.log(dpp::ll_info, "Session " + m_guild.str() + ": now playing '" + t->title + "'");
            auto listener = m_listener;
            auto guild = m_guild;
            after.push_back([listener, guild, t] { listener->on_now_playing(guild, t); });
        } else {
            const std::string reason = *failure;
            auto listener = m_listener;
            auto guild = m_guild;
            after.push_back([listener, guild, t, reason] { listener->on_track_error(guild, t, reason); });

            m_state = playback_state::error;
            ++m_attempts;
            if (m_attempts > m_opts.retry_budget) {
                std::ostringstream oss;
                oss << "Session " << m_guild.str() << ": giving up after " << m_attempts << " attempt(s): " << reason;
                m_log.log(dpp::ll_warning, oss.str());

                m_state    = playback_state::idle;
                m_attempts = 0;
                after.push_back([listener, guild, reason] { listener->on_playback_failed(guild, reason); });
            } else {
                advance_and_continue(after);
            }
        }
    }
    run(after);
}

void session_engine::start_at_locked(std::size_t index, deferred& after)
{
    teardown(true);
    m_queue.set_cursor(index);
    m_attempts = 0;
    begin_prepare(after);
}

void session_engine::teardown(bool stop_sink)
{
    ++m_generation;
    m_preparing = false;
    if (m_handle) {
        m_handle->close();
        m_handle.reset();
    }
    if (stop_sink && (m_state == playback_state::playing || m_state == playback_state::paused)) {
        m_sink->stop(m_guild);
    }
    m_now_playing.reset();
    m_state = playback_state::idle;
}

void session_engine::advance_and_continue(deferred& after)
{
    m_queue.advance();
    if (m_queue.current()) {
        begin_prepare(after);
        return;
    }

    m_state    = playback_state::idle;
    m_attempts = 0;
    auto listener = m_listener;
    auto guild = m_guild;
    after.push_back([listener, guild] { listener->on_queue_exhausted(guild); });
}

void session_engine::signal_completion(std::uint64_t generation, std::optional<std::string> failure)
{
    auto self = shared_from_this();
    m_executor([self, generation, failure] { self->on_completion(generation, failure); });
}

void session_engine::on_completion(std::uint64_t generation, std::optional<std::string> failure)
{
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation || m_state != playback_state::playing) {
            std::ostringstream oss;
            oss << "Session " << m_guild.str() << ": ignoring completion for generation " << generation
                << " (now " << m_generation << ", " << to_string(m_state) << ")";
            m_log.log(dpp::ll_warning, oss.str());
            return;
        }
        touch();

        if (failure) {
            auto listener = m_listener;
            auto guild = m_guild;
            auto t = m_now_playing;
            const std::string reason = *failure;
            after.push_back([listener, guild, t, reason] { listener->on_track_error(guild, t, reason); });
        }

        teardown(false);
        m_attempts = 0;
        advance_and_continue(after);
    }
    run(after);
}

void session_engine::play(std::optional<std::size_t> index)
{
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch();

        if (m_queue.empty()) {
            auto listener = m_listener;
            auto guild = m_guild;
            after.push_back([listener, guild] { listener->on_queue_exhausted(guild); });
        } else if (index) {
            if (*index >= m_queue.size()) {
                throw index_out_of_range(*index, m_queue.size());
            }
            start_at_locked(*index, after);
        } else if (!busy_locked()) {
            if (!m_queue.current()) {
                m_queue.set_cursor(m_queue.resume_index());
            }
            m_attempts = 0;
            begin_prepare(after);
        }
    }
    run(after);
}

bool session_engine::pause()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    if (m_state != playback_state::playing) {
        return false;
    }
    m_sink->pause(m_guild, true);
    m_state = playback_state::paused;
    return true;
}

bool session_engine::resume()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    if (m_state != playback_state::paused) {
        return false;
    }
    m_sink->pause(m_guild, false);
    m_state = playback_state::playing;
    return true;
}

bool session_engine::skip()
{
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch();
        if (!busy_locked()) {
            return false;
        }
        teardown(true);
        m_attempts = 0;
        advance_and_continue(after);
    }
    run(after);
    return true;
}

void session_engine::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    teardown(true);
    m_queue.clear();
    m_attempts = 0;
    m_log.log(dpp::ll_info, "Session " + m_guild.str() + ": stopped");
}

std::size_t session_engine::enqueue(track_ptr t, std::optional<std::size_t> position)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    return m_queue.enqueue(std::move(t), position);
}

enqueue_outcome session_engine::enqueue_and_play(track_ptr t, std::optional<std::size_t> position)
{
    enqueue_outcome out;
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch();
        out.index = m_queue.enqueue(std::move(t), position);
        if (!busy_locked()) {
            start_at_locked(out.index, after);
            out.started = true;
        }
    }
    run(after);
    return out;
}

enqueue_outcome session_engine::enqueue_all(const std::vector<track_ptr>& tracks, bool start_if_idle)
{
    enqueue_outcome out;
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch();
        if (m_queue.size() + tracks.size() > m_queue.max_size()) {
            throw queue_full(m_queue.max_size());
        }
        out.index = m_queue.size();
        for (const auto& t : tracks) {
            m_queue.enqueue(t);
        }
        if (start_if_idle && !tracks.empty() && !busy_locked()) {
            start_at_locked(out.index, after);
            out.started = true;
        }
    }
    run(after);
    return out;
}

track_ptr session_engine::remove_at(std::size_t index)
{
    track_ptr removed;
    deferred after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        touch();

        const auto cursor = m_queue.cursor();
        const bool was_current = busy_locked() && cursor.has_value() && *cursor == index;
        removed = m_queue.remove_at(index);

        if (was_current) {
            m_log.log(dpp::ll_info, "Session " + m_guild.str() + ": current track removed");
            teardown(true);
            m_attempts = 0;
            advance_and_continue(after);
        }
    }
    run(after);
    return removed;
}

void session_engine::reorder(std::size_t from, std::size_t to)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    m_queue.reorder(from, to);
}

void session_engine::clear_queue()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    m_queue.clear();
}

void session_engine::set_loop_mode(loop_mode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    m_queue.set_loop(mode);
}

bool session_engine::toggle_shuffle()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    m_queue.set_shuffle(!m_queue.shuffle());
    return m_queue.shuffle();
}

int session_engine::set_volume(int percent)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    touch();
    m_volume = std::clamp(percent, 0, max_volume);
    m_sink->set_volume(m_guild, m_volume);
    return m_volume;
}

queue_snapshot session_engine::queue() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto snap = m_queue.snapshot();
    snap.volume = m_volume;
    return snap;
}

track_ptr session_engine::now_playing() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_now_playing;
}

playback_state session_engine::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool session_engine::busy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return busy_locked();
}

bool session_engine::busy_locked() const
{
    return m_preparing || m_state == playback_state::playing || m_state == playback_state::paused;
}

std::uint64_t session_engine::generation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

session_engine::clock::time_point session_engine::last_activity() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_activity;
}

} // namespace mz::session
