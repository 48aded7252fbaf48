#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <dpp/json.h>

#include "mz/log.hpp"
#include "mz/net/http_client.hpp"
#include "mz/providers/provider_adapter.hpp"

namespace mz::providers {

/// Provider C. Uses the api-v2 search endpoint, then trades each
/// transcoding URL for a signed stream URL.
class soundcloud_search {
public:
    static constexpr std::size_t max_tracks = 3;

    soundcloud_search(std::shared_ptr<net::http_client> http,
                      std::string client_id,
                      std::chrono::milliseconds timeout,
                      logger log = {});

    std::vector<track_candidate> search(const std::string& query, quality q) const;

private:
    std::optional<track_candidate> to_candidate(const dpp::json& item, quality q) const;
    std::string resolve_transcoding(const std::string& url) const;
    std::string with_client_id(const std::string& url) const;

    std::shared_ptr<net::http_client> m_http;
    std::string                       m_client_id;
    std::chrono::milliseconds         m_timeout;
    logger                            m_log;
};

} // namespace mz::providers
