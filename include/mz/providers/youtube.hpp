#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mz/log.hpp"
#include "mz/net/http_client.hpp"
#include "mz/providers/provider_adapter.hpp"

namespace mz::providers {

/// Provider A. Finds video ids on the results page, then reads the player
/// response embedded in each watch page for its direct audio formats.
/// One search, page fetches included, stays within the configured timeout.
class youtube_search {
public:
    static constexpr std::size_t max_ids   = 5;
    static constexpr std::size_t max_pages = 3;

    youtube_search(std::shared_ptr<net::http_client> http,
                   std::chrono::milliseconds timeout,
                   logger log = {});

    std::vector<track_candidate> search(const std::string& query, quality q) const;

    /// Distinct 11-character ids in page order, at most `limit`.
    static std::vector<std::string> extract_video_ids(const std::string& html, std::size_t limit);

    /// Id of a watch/shorts/youtu.be URL, empty for anything else.
    static std::string video_id_from_url(const std::string& url);

    static std::optional<track_candidate> parse_watch_page(const std::string& video_id,
                                                           const std::string& html,
                                                           quality q);

    static std::string watch_url(const std::string& video_id);

private:
    std::optional<track_candidate> inspect(const std::string& video_id, quality q,
                                           std::chrono::milliseconds timeout) const;

    std::shared_ptr<net::http_client> m_http;
    std::chrono::milliseconds         m_timeout;
    logger                            m_log;
};

} // namespace mz::providers
