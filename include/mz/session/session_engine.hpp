#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <dpp/snowflake.h>

#include "mz/core/play_queue.hpp"
#include "mz/core/track.hpp"
#include "mz/log.hpp"
#include "mz/session/audio_sink.hpp"
#include "mz/session/events.hpp"
#include "mz/stream/stream_preparer.hpp"
#include "mz/util/worker_pool.hpp"

namespace mz::session {

struct engine_options {
    std::size_t max_queue_size = 100;
    int         retry_budget   = 3;
};

struct enqueue_outcome {
    std::size_t index   = 0; // where the (first) track landed
    bool        started = false;
};

/// Per-guild playback state machine.
///
/// Every command runs under the session's own lock. Stream preparation is
/// posted to the executor and never holds the lock; its result is only
/// applied if the generation it was started under is still current, so a
/// skip or stop issued in the meantime wins.
class session_engine : public std::enable_shared_from_this<session_engine> {
public:
    using clock = std::chrono::steady_clock;

    static std::shared_ptr<session_engine> create(dpp::snowflake guild,
                                                  engine_options opts,
                                                  std::shared_ptr<stream::stream_preparer> preparer,
                                                  std::shared_ptr<audio_sink> sink,
                                                  std::shared_ptr<session_listener> listener,
                                                  util::executor_fn executor,
                                                  logger log = {});

    session_engine(const session_engine&) = delete;
    session_engine& operator=(const session_engine&) = delete;

    // ---------- playback control ----------

    /// Starts the item at `index`, or the current/next item when none is
    /// given. An empty queue stays idle and reports queue_exhausted. Without
    /// an index this is a no-op while something is already playing.
    void play(std::optional<std::size_t> index = std::nullopt);

    bool pause();
    bool resume();

    /// Valid while playing, paused or preparing. Returns false otherwise.
    bool skip();

    void stop();

    // ---------- queue ----------

    std::size_t enqueue(track_ptr t, std::optional<std::size_t> position = std::nullopt);

    /// Queues the track and, in the same step, starts it if nothing is
    /// playing or being prepared.
    enqueue_outcome enqueue_and_play(track_ptr t, std::optional<std::size_t> position = std::nullopt);

    /// All or nothing: throws queue_full without adding anything. With
    /// `start_if_idle` the first added track starts when the session is idle.
    enqueue_outcome enqueue_all(const std::vector<track_ptr>& tracks, bool start_if_idle = false);

    /// Removing the item that is playing stops it and moves on to the
    /// track that takes its place.
    track_ptr remove_at(std::size_t index);
    void reorder(std::size_t from, std::size_t to);
    void clear_queue();

    void set_loop_mode(loop_mode mode);
    bool toggle_shuffle();

    static constexpr int max_volume = 100;

    /// Clamps to [0, max_volume] and forwards to the sink. Returns the value set.
    int set_volume(int percent);

    // ---------- queries ----------

    queue_snapshot queue() const;
    track_ptr now_playing() const;
    playback_state state() const;

    /// Playing, paused, or a stream is being prepared.
    bool busy() const;

    std::uint64_t generation() const;
    clock::time_point last_activity() const;
    dpp::snowflake guild() const { return m_guild; }

private:
    friend class completion_token;

    using deferred = std::vector<std::function<void()>>;

    session_engine(dpp::snowflake guild,
                   engine_options opts,
                   std::shared_ptr<stream::stream_preparer> preparer,
                   std::shared_ptr<audio_sink> sink,
                   std::shared_ptr<session_listener> listener,
                   util::executor_fn executor,
                   logger log);

    void signal_completion(std::uint64_t generation, std::optional<std::string> failure);
    void on_completion(std::uint64_t generation, std::optional<std::string> failure);

    void begin_prepare(deferred& after);
    void run_prepare(std::uint64_t generation, track_ptr t);
    void on_prepared(std::uint64_t generation, track_ptr t,
                     stream::stream_handle_ptr handle, std::optional<std::string> failure);

    bool busy_locked() const;
    void start_at_locked(std::size_t index, deferred& after);
    void teardown(bool stop_sink);
    void advance_and_continue(deferred& after);
    void touch();

    static void run(deferred& after);

    const dpp::snowflake                     m_guild;
    const engine_options                     m_opts;
    std::shared_ptr<stream::stream_preparer> m_preparer;
    std::shared_ptr<audio_sink>              m_sink;
    std::shared_ptr<session_listener>        m_listener;
    util::executor_fn                        m_executor;
    logger                                   m_log;

    mutable std::mutex        m_mutex;
    play_queue                m_queue;
    playback_state            m_state      = playback_state::idle;
    bool                      m_preparing  = false;
    std::uint64_t             m_generation = 0;
    int                       m_attempts   = 0;
    int                       m_volume     = max_volume;
    track_ptr                 m_now_playing;
    stream::stream_handle_ptr m_handle;
    clock::time_point         m_last_activity;
};

} // namespace mz::session
