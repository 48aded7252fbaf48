#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/dpp.h>

#include "mz/config.hpp"
#include "mz/session/audio_sink.hpp"

namespace mz::lavalink {

struct loaded_track {
    std::string  encoded;
    std::string  title;
    std::string  author;
    std::string  uri;
    std::int64_t length_ms = 0;
    bool         is_stream = false;
};

enum class load_type {
    track,
    playlist,
    search,
    empty,
    error
};

struct load_result {
    load_type                 type = load_type::empty;
    std::vector<loaded_track> tracks;
    std::string               error_message; // for load_type::error
};

/// Parses a /v4/loadtracks body. Anything unreadable comes back as error.
load_result parse_load_result(const std::string& body);

/// A Lavalink v4 node used as the session audio sink. Every call returns
/// immediately; the HTTP work finishes on the cluster's request threads.
class node : public session::audio_sink {
public:
    node(dpp::cluster& cluster, const lavalink_settings& cfg);

    // Hook these from the bot
    void handle_voice_state_update(const dpp::voice_state_update_t& ev);
    void handle_voice_server_update(const dpp::voice_server_update_t& ev);

    /// PATCH /v4/sessions/{sessionId}. Call from on_ready, not before start.
    void ensure_session();

    void start(dpp::snowflake guild, const stream::stream_handle_ptr& handle,
               session::completion_token token) override;
    void pause(dpp::snowflake guild, bool paused) override;
    void stop(dpp::snowflake guild) override;
    void set_volume(dpp::snowflake guild, int percent) override;

    /// Timer tick. Asks the node about every started player and completes
    /// the token of any whose track has ended.
    void poll_players();

private:
    using response_fn = std::function<void(const dpp::http_request_completion_t&)>;

    struct voice_state {
        std::string session_id; // Discord voice session id
        std::string token;
        std::string endpoint;
    };

    struct player {
        session::completion_token token;
        bool started = false; // the node accepted the track
    };

    void request(dpp::http_method method, const std::string& urlpath,
                 const std::string& body_json, response_fn done) const;

    void send_player_update(dpp::snowflake guild, const dpp::json& payload,
                            std::function<void(bool)> done = {});

    void on_loaded(dpp::snowflake guild, std::uint64_t generation, const load_result& result);
    void on_player_state(dpp::snowflake guild, std::uint64_t generation, const std::string& body);

    std::optional<voice_state> get_voice_state_locked(dpp::snowflake guild) const;
    std::optional<session::completion_token> take_player(dpp::snowflake guild, std::uint64_t generation);

    std::string players_path(dpp::snowflake guild) const;

    dpp::cluster&     m_cluster;
    lavalink_settings m_cfg;
    std::string       m_base_url;

    mutable std::mutex m_voice_mutex;
    std::unordered_map<dpp::snowflake, voice_state> m_voice_states;

    std::mutex m_players_mutex;
    std::unordered_map<dpp::snowflake, player> m_players;
    std::unordered_map<dpp::snowflake, int>    m_volumes; // sent again with every new track
};

} // namespace mz::lavalink
