#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mz/log.hpp"
#include "mz/net/http_client.hpp"
#include "mz/providers/provider_adapter.hpp"
#include "mz/providers/youtube.hpp"

namespace mz::providers {

struct spotify_metadata {
    std::string  title;
    std::string  artist;
    std::string  album;
    std::int64_t duration_seconds = 0;
};

/// Provider B. Spotify pages only give metadata, so the audio comes from
/// provider A searched with that metadata. Results are relabelled as B.
class spotify_search {
public:
    spotify_search(std::shared_ptr<net::http_client> http,
                   std::shared_ptr<const youtube_search> audio_source,
                   std::chrono::milliseconds timeout,
                   logger log = {});

    std::vector<track_candidate> search(const std::string& query, quality q) const;

    static std::optional<spotify_metadata> scrape_metadata(const std::string& html);

private:
    std::optional<spotify_metadata> lookup(const std::string& query) const;
    std::vector<track_candidate> search_audio(const std::string& query, quality q) const;

    std::shared_ptr<net::http_client>     m_http;
    std::shared_ptr<const youtube_search> m_audio;
    std::chrono::milliseconds             m_timeout;
    logger                                m_log;
};

} // namespace mz::providers
