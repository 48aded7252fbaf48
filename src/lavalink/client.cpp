#include "mz/lavalink/client.hpp"

#include <map>
#include <sstream>

namespace mz::lavalink {

using json = dpp::json;

load_result parse_load_result(const std::string& body)
{
    load_result result;

    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("loadType")) {
        result.type = load_type::error;
        result.error_message = "unreadable /loadtracks response";
        return result;
    }

    const std::string type = j.value("loadType", "");
    if (type == "track") {
        result.type = load_type::track;
    } else if (type == "playlist") {
        result.type = load_type::playlist;
    } else if (type == "search") {
        result.type = load_type::search;
    } else if (type == "error") {
        result.type = load_type::error;
        if (j.contains("data") && j["data"].is_object()) {
            result.error_message = j["data"].value("message", "");
        }
        return result;
    } else {
        result.type = load_type::empty;
        return result;
    }

    if (!j.contains("data")) {
        return result;
    }

    // track -> object, playlist -> {tracks: [...]}, search -> [...]
    json items = json::array();
    const auto& data = j["data"];
    if (result.type == load_type::track && data.is_object()) {
        items.push_back(data);
    } else if (result.type == load_type::playlist && data.contains("tracks")) {
        items = data["tracks"];
    } else if (data.is_array()) {
        items = data;
    }

    for (const auto& item : items) {
        loaded_track t;
        if (item.contains("encoded") && item["encoded"].is_string()) {
            t.encoded = item["encoded"].get<std::string>();
        }
        if (item.contains("info") && item["info"].is_object()) {
            const auto& info = item["info"];
            t.title     = info.value("title", "");
            t.uri       = info.value("uri", "");
            t.author    = info.value("author", "");
            t.length_ms = info.value("length", static_cast<std::int64_t>(0));
            t.is_stream = info.value("isStream", false);
        }
        if (!t.encoded.empty()) {
            result.tracks.push_back(std::move(t));
        }
    }
    return result;
}

node::node(dpp::cluster& cluster, const lavalink_settings& cfg)
    : m_cluster(cluster)
    , m_cfg(cfg)
{
    m_base_url = (m_cfg.https ? "https://" : "http://")
               + m_cfg.host + ":" + std::to_string(m_cfg.port);

    std::ostringstream oss;
    oss << "[Lavalink] Using host=" << m_base_url
        << " session_id=" << m_cfg.session_id;
    m_cluster.log(dpp::ll_info, oss.str());
}

void node::handle_voice_state_update(const dpp::voice_state_update_t& ev)
{
    if (ev.state.user_id != m_cluster.me.id) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.state.guild_id];
    vs.session_id = ev.state.session_id;

    std::ostringstream oss;
    oss << "Cached voice_state for guild " << ev.state.guild_id
        << " session_id=" << ev.state.session_id;
    m_cluster.log(dpp::ll_debug, oss.str());
}

void node::handle_voice_server_update(const dpp::voice_server_update_t& ev)
{
    std::lock_guard<std::mutex> lock(m_voice_mutex);
    auto& vs = m_voice_states[ev.guild_id];
    vs.token    = ev.token;
    vs.endpoint = ev.endpoint;

    std::ostringstream oss;
    oss << "Cached voice_server for guild " << ev.guild_id
        << " token=<set> endpoint=" << ev.endpoint;
    m_cluster.log(dpp::ll_debug, oss.str());
}

std::optional<node::voice_state> node::get_voice_state_locked(dpp::snowflake guild) const
{
    auto it = m_voice_states.find(guild);
    if (it == m_voice_states.end()) {
        return std::nullopt;
    }
    if (it->second.session_id.empty() || it->second.token.empty() || it->second.endpoint.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::string node::players_path(dpp::snowflake guild) const
{
    return "/v4/sessions/" + m_cfg.session_id + "/players/" + guild.str();
}

void node::request(dpp::http_method method, const std::string& urlpath,
                   const std::string& body_json, response_fn done) const
{
    const std::string full_url = m_base_url + urlpath;

    std::multimap<std::string, std::string> headers{
        { "Authorization", m_cfg.password }
    };

    {
        std::ostringstream oss;
        oss << "Lavalink HTTP request: " << urlpath
            << " (body=" << (body_json.empty() ? "empty" : std::to_string(body_json.size()) + " bytes") << ")";
        m_cluster.log(dpp::ll_debug, oss.str());
    }

    m_cluster.request(
        full_url,
        method,
        [this, urlpath, done](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "Lavalink HTTP " << cc.status << " on " << urlpath
                << " (response length=" << cc.body.size() << ")";
            if (cc.status < 200 || cc.status >= 300) {
                m_cluster.log(dpp::ll_warning, oss.str() + (cc.body.empty() ? "" : ": " + cc.body));
            } else {
                m_cluster.log(dpp::ll_debug, oss.str());
            }
            if (done) {
                done(cc);
            }
        },
        body_json,
        body_json.empty() ? "" : "application/json",
        headers
    );
}

void node::ensure_session()
{
    json payload;
    payload["resuming"] = true;
    payload["timeout"]  = 60;

    const std::string path = "/v4/sessions/" + m_cfg.session_id;
    m_cluster.log(dpp::ll_debug, "[Lavalink] Ensuring session '" + m_cfg.session_id + "' via PATCH " + path);

    request(dpp::m_patch, path, payload.dump(), [this](const dpp::http_request_completion_t& cc) {
        if (cc.status < 200 || cc.status >= 300) {
            m_cluster.log(dpp::ll_warning, "[Lavalink] Failed to ensure session '" + m_cfg.session_id + "'");
            return;
        }
        m_cluster.log(dpp::ll_info, "[Lavalink] Session '" + m_cfg.session_id + "' ensured/created");
    });
}

void node::send_player_update(dpp::snowflake guild, const json& payload, std::function<void(bool)> done)
{
    if (m_cfg.session_id.empty()) {
        m_cluster.log(dpp::ll_warning, "[Lavalink] Cannot send player update: session_id is empty");
        if (done) {
            done(false);
        }
        return;
    }

    std::ostringstream oss;
    oss << "Sending player update to Lavalink for guild " << guild << ": " << payload.dump();
    m_cluster.log(dpp::ll_debug, oss.str());

    request(dpp::m_patch, players_path(guild), payload.dump(), [done](const dpp::http_request_completion_t& cc) {
        if (done) {
            done(cc.status >= 200 && cc.status < 300);
        }
    });
}

std::optional<session::completion_token> node::take_player(dpp::snowflake guild, std::uint64_t generation)
{
    std::lock_guard<std::mutex> lock(m_players_mutex);
    auto it = m_players.find(guild);
    if (it == m_players.end() || it->second.token.generation() != generation) {
        return std::nullopt;
    }
    auto token = it->second.token;
    m_players.erase(it);
    return token;
}

void node::start(dpp::snowflake guild, const stream::stream_handle_ptr& handle, session::completion_token token)
{
    const auto generation = token.generation();
    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        player p;
        p.token = std::move(token);
        m_players[guild] = std::move(p);
    }

    const std::string identifier = handle->locator();
    m_cluster.log(dpp::ll_debug, "Requesting /v4/loadtracks for identifier: " + identifier);

    request(dpp::m_get, "/v4/loadtracks?identifier=" + dpp::utility::url_encode(identifier), "",
        [this, guild, generation](const dpp::http_request_completion_t& cc) {
            if (cc.status < 200 || cc.status >= 300) {
                load_result failed;
                failed.type = load_type::error;
                failed.error_message = "node answered " + std::to_string(cc.status);
                on_loaded(guild, generation, failed);
                return;
            }
            on_loaded(guild, generation, parse_load_result(cc.body));
        });
}

void node::on_loaded(dpp::snowflake guild, std::uint64_t generation, const load_result& result)
{
    if (result.type == load_type::error || result.type == load_type::empty || result.tracks.empty()) {
        if (auto token = take_player(guild, generation)) {
            token->fail(result.error_message.empty() ? "nothing playable found" : result.error_message);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        auto it = m_players.find(guild);
        if (it == m_players.end() || it->second.token.generation() != generation) {
            return; // superseded while loading
        }
    }

    json payload;
    payload["encodedTrack"] = result.tracks.front().encoded;

    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        auto it = m_volumes.find(guild);
        if (it != m_volumes.end()) {
            payload["volume"] = it->second;
        }
    }

    std::optional<voice_state> vs;
    {
        std::lock_guard<std::mutex> lock(m_voice_mutex);
        vs = get_voice_state_locked(guild);
    }
    if (vs.has_value()) {
        payload["voice"]["token"]     = vs->token;
        payload["voice"]["endpoint"]  = vs->endpoint;
        payload["voice"]["sessionId"] = vs->session_id;
    }

    std::ostringstream oss;
    oss << "Sending play to Lavalink for guild " << guild << ": " << result.tracks.front().title;
    m_cluster.log(dpp::ll_info, oss.str());

    send_player_update(guild, payload, [this, guild, generation](bool ok) {
        if (!ok) {
            if (auto token = take_player(guild, generation)) {
                token->fail("player update rejected");
            }
            return;
        }
        std::lock_guard<std::mutex> lock(m_players_mutex);
        auto it = m_players.find(guild);
        if (it != m_players.end() && it->second.token.generation() == generation) {
            it->second.started = true;
        }
    });
}

void node::pause(dpp::snowflake guild, bool paused)
{
    json payload;
    payload["paused"] = paused;

    std::ostringstream oss;
    oss << "Sending pause=" << (paused ? "true" : "false") << " to Lavalink for guild " << guild;
    m_cluster.log(dpp::ll_info, oss.str());

    send_player_update(guild, payload);
}

void node::stop(dpp::snowflake guild)
{
    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        m_players.erase(guild);
    }

    json payload;
    payload["encodedTrack"] = nullptr;

    std::ostringstream oss;
    oss << "Sending stop to Lavalink for guild " << guild;
    m_cluster.log(dpp::ll_info, oss.str());

    send_player_update(guild, payload);
}

void node::set_volume(dpp::snowflake guild, int percent)
{
    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        m_volumes[guild] = percent;
    }

    json payload;
    payload["volume"] = percent;

    std::ostringstream oss;
    oss << "Sending volume=" << percent << " to Lavalink for guild " << guild;
    m_cluster.log(dpp::ll_info, oss.str());

    send_player_update(guild, payload);
}

void node::poll_players()
{
    std::vector<std::pair<dpp::snowflake, std::uint64_t>> started;
    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        for (const auto& [guild, p] : m_players) {
            if (p.started) {
                started.emplace_back(guild, p.token.generation());
            }
        }
    }

    for (const auto& [guild, generation] : started) {
        const auto g = guild;
        const auto gen = generation;
        request(dpp::m_get, players_path(g), "", [this, g, gen](const dpp::http_request_completion_t& cc) {
            if (cc.status == 404) {
                if (auto token = take_player(g, gen)) {
                    token->fail("player no longer exists on the node");
                }
                return;
            }
            if (cc.status < 200 || cc.status >= 300) {
                return; // try again next tick
            }
            on_player_state(g, gen, cc.body);
        });
    }
}

void node::on_player_state(dpp::snowflake guild, std::uint64_t generation, const std::string& body)
{
    const auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        m_cluster.log(dpp::ll_warning, "[Lavalink] Unreadable player state for guild " + guild.str());
        return;
    }

    const bool has_track = j.contains("track") && !j["track"].is_null();
    {
        std::lock_guard<std::mutex> lock(m_players_mutex);
        auto it = m_players.find(guild);
        if (it == m_players.end() || it->second.token.generation() != generation) {
            return;
        }
        if (has_track) {
            return;
        }
    }

    // The track was set by our PATCH, so an empty player means it ran out
    if (auto token = take_player(guild, generation)) {
        m_cluster.log(dpp::ll_debug, "[Lavalink] Track finished for guild " + guild.str());
        token->complete();
    }
}

} // namespace mz::lavalink
