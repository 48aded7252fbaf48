#include "mz/config.hpp"

#include "mz/core/errors.hpp"

#include <cstdlib>
#include <fstream>

namespace mz {

namespace {

template <typename T>
T read_positive(const dpp::json& j, const char* key, T fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        throw config_error(std::string("config key '") + key + "' must be an integer");
    }
    const auto n = v.get<std::int64_t>();
    if (n <= 0) {
        throw config_error(std::string("config key '") + key + "' must be positive");
    }
    return static_cast<T>(n);
}

std::string read_string(const dpp::json& j, const char* key, const std::string& fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_string()) {
        throw config_error(std::string("config key '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

bool read_bool(const dpp::json& j, const char* key, bool fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_boolean()) {
        throw config_error(std::string("config key '") + key + "' must be true or false");
    }
    return j[key].get<bool>();
}

double read_number(const dpp::json& j, const char* key, double fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_number()) {
        throw config_error(std::string("config key '") + key + "' must be a number");
    }
    return j[key].get<double>();
}

} // namespace

config config_from_json(const dpp::json& j)
{
    config cfg;
    if (!j.is_object()) {
        throw config_error("config root must be a JSON object");
    }

    cfg.max_queue_size    = read_positive<std::size_t>(j, "maxQueueSize", cfg.max_queue_size);
    cfg.max_playlist_size = read_positive<std::size_t>(j, "maxPlaylistSize", cfg.max_playlist_size);
    cfg.download_path     = read_string(j, "downloadPath", cfg.download_path);

    cfg.resolution_timeout = std::chrono::milliseconds(
        read_positive<std::int64_t>(j, "resolutionTimeoutMs", cfg.resolution_timeout.count()));
    cfg.verification_timeout = std::chrono::milliseconds(
        read_positive<std::int64_t>(j, "verificationTimeoutMs", cfg.verification_timeout.count()));

    if (j.contains("retryBudget")) {
        if (!j["retryBudget"].is_number_integer() || j["retryBudget"].get<int>() < 0) {
            throw config_error("config key 'retryBudget' must be a non-negative integer");
        }
        cfg.retry_budget = j["retryBudget"].get<int>();
    }

    if (j.contains("providerPriorityOrder")) {
        const auto& order = j["providerPriorityOrder"];
        if (!order.is_array() || order.empty()) {
            throw config_error("config key 'providerPriorityOrder' must be a non-empty array");
        }
        cfg.provider_priority_order.clear();
        for (const auto& el : order) {
            const auto id = el.is_string() ? parse_provider(el.get<std::string>()) : std::nullopt;
            if (!id.has_value()) {
                throw config_error("unknown provider in 'providerPriorityOrder': " + el.dump());
            }
            cfg.provider_priority_order.push_back(*id);
        }
    }

    cfg.session_idle_timeout = std::chrono::seconds(
        read_positive<std::int64_t>(j, "sessionIdleTimeoutS", cfg.session_idle_timeout.count()));
    cfg.worker_threads       = read_positive<std::size_t>(j, "workerThreads", cfg.worker_threads);
    cfg.soundcloud_client_id = read_string(j, "soundcloudClientId", cfg.soundcloud_client_id);
    cfg.playlist_store_path  = read_string(j, "playlistStorePath", cfg.playlist_store_path);

    if (j.contains("scoring")) {
        const auto& s = j["scoring"];
        cfg.title_tolerance = read_number(s, "titleTolerance", cfg.title_tolerance);
        if (cfg.title_tolerance < 0.0 || cfg.title_tolerance >= 1.0) {
            throw config_error("config key 'titleTolerance' must be at least 0 and below 1");
        }
    }

    if (j.contains("lavalink")) {
        const auto& l = j["lavalink"];
        cfg.lavalink.host       = read_string(l, "host", cfg.lavalink.host);
        cfg.lavalink.port       = read_positive<uint16_t>(l, "port", cfg.lavalink.port);
        cfg.lavalink.https      = read_bool(l, "https", cfg.lavalink.https);
        cfg.lavalink.password   = read_string(l, "password", cfg.lavalink.password);
        cfg.lavalink.session_id = read_string(l, "sessionId", cfg.lavalink.session_id);
    }

    return cfg;
}

config load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        return config{};
    }

    dpp::json j;
    try {
        j = dpp::json::parse(in);
    } catch (const dpp::json::exception& e) {
        throw config_error("cannot parse " + path + ": " + e.what());
    }
    return config_from_json(j);
}

std::string discord_token()
{
    if (const char* t = std::getenv("DISCORD_TOKEN")) {
        return t;
    }
    if (const char* t = std::getenv("token")) {
        return t;
    }
    return {};
}

} // namespace mz
