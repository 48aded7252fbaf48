#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <dpp/dpp.h>

#include "mz/net/http_client.hpp"

namespace mz::net {

/// http_client over dpp::cluster::request. Rotates a browser User-Agent on
/// every request, since scraped providers reject library agents.
class cluster_http_client : public http_client {
public:
    explicit cluster_http_client(dpp::cluster& cluster);

    http_response get(const std::string& url,
                      const header_map& headers,
                      std::chrono::milliseconds timeout) override;

private:
    const std::string& next_user_agent();

    dpp::cluster& m_cluster;

    std::mutex               m_ua_mutex;
    std::size_t              m_ua_index = 0;
    std::vector<std::string> m_user_agents;
};

} // namespace mz::net
