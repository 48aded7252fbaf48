#pragma once

// audio_sink that remembers what it was told and keeps the tokens so a test
// can end a stream whenever it likes.

#include <mutex>
#include <string>
#include <vector>

#include "mz/session/audio_sink.hpp"

namespace mz::tests::fixtures {

class recording_sink : public mz::session::audio_sink {
public:
    struct started {
        dpp::snowflake                    guild;
        mz::stream::stream_handle_ptr     handle;
        mz::session::completion_token     token;
    };

    void start(dpp::snowflake guild, const mz::stream::stream_handle_ptr& handle,
               mz::session::completion_token token) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_started.push_back({ guild, handle, std::move(token) });
    }

    void pause(dpp::snowflake /*guild*/, bool paused) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pauses.push_back(paused);
    }

    void stop(dpp::snowflake /*guild*/) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stops;
    }

    void set_volume(dpp::snowflake /*guild*/, int percent) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_volumes.push_back(percent);
    }

    std::vector<started> starts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started;
    }

    std::size_t start_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started.size();
    }

    /// Token of the most recent start. Call only after a start.
    mz::session::completion_token last_token() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started.back().token;
    }

    std::string last_title() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started.back().handle->source()->title;
    }

    std::vector<bool> pauses() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pauses;
    }

    std::vector<int> volumes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_volumes;
    }

    int stop_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stops;
    }

private:
    mutable std::mutex   m_mutex;
    std::vector<started> m_started;
    std::vector<bool>    m_pauses;
    std::vector<int>     m_volumes;
    int                  m_stops = 0;
};

} // namespace mz::tests::fixtures
