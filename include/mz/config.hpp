#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <dpp/json.h>

#include "mz/core/track.hpp"

namespace mz {

struct lavalink_settings {
    std::string host       = "127.0.0.1";
    uint16_t    port       = 2333;
    bool        https      = false;
    std::string password   = "youshallnotpass";
    std::string session_id = "default";
};

struct config {
    std::size_t              max_queue_size    = 100;
    std::size_t              max_playlist_size = 50;
    std::string              download_path     = "./downloads";
    std::vector<provider_id> provider_priority_order{ provider_id::a, provider_id::b, provider_id::c };

    std::chrono::milliseconds resolution_timeout{ 10000 };
    std::chrono::milliseconds verification_timeout{ 5000 };
    int                       retry_budget = 3;

    std::chrono::seconds session_idle_timeout{ 300 };
    std::size_t          worker_threads = 4;

    std::string soundcloud_client_id;
    std::string playlist_store_path; // empty = keep playlists in memory only

    double title_tolerance = 0.0; // in [0, 1)

    lavalink_settings lavalink;
};

/// Reads a JSON config file. A missing file gives the defaults.
/// Throws config_error on malformed JSON or invalid values.
config load_config(const std::string& path);

/// Overlays the recognised keys of `j` onto the defaults.
config config_from_json(const dpp::json& j);

/// DISCORD_TOKEN, falling back to `token`. Empty if neither is set.
std::string discord_token();

} // namespace mz
