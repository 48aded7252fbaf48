#include "mz/net/cluster_http_client.hpp"

#include <future>
#include <memory>
#include <sstream>

namespace mz::net {

cluster_http_client::cluster_http_client(dpp::cluster& cluster)
    : m_cluster(cluster)
    , m_user_agents{
          "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
          "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
          "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36",
      }
{
}

const std::string& cluster_http_client::next_user_agent()
{
    std::lock_guard<std::mutex> lock(m_ua_mutex);
    const auto& ua = m_user_agents[m_ua_index % m_user_agents.size()];
    ++m_ua_index;
    return ua;
}

http_response cluster_http_client::get(const std::string& url,
                                       const header_map& headers,
                                       std::chrono::milliseconds timeout)
{
    header_map all = headers;
    if (all.find("User-Agent") == all.end()) {
        all.emplace("User-Agent", next_user_agent());
    }
    if (all.find("Accept-Language") == all.end()) {
        all.emplace("Accept-Language", "en-US,en;q=0.5");
    }

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.log(dpp::ll_debug, "HTTP request: GET " + url);

    m_cluster.request(
        url,
        dpp::m_get,
        [this, url, prom](const dpp::http_request_completion_t& cc) {
            std::ostringstream oss;
            oss << "HTTP " << cc.status << " on GET " << url
                << " (response length=" << cc.body.size() << ")";

            if (cc.status == 0) {
                m_cluster.log(dpp::ll_warning, oss.str() + " (request failed)");
            } else if (cc.status >= 400) {
                m_cluster.log(dpp::ll_warning, oss.str());
            } else {
                m_cluster.log(dpp::ll_debug, oss.str());
            }

            prom->set_value(cc);
        },
        "",
        "",
        all
    );

    // The callback keeps the promise alive if we give up first
    if (fut.wait_for(timeout) != std::future_status::ready) {
        std::ostringstream oss;
        oss << "timed out after " << timeout.count() << " ms: GET " << url;
        throw transport_error(oss.str());
    }

    const auto cc = fut.get();
    if (cc.status == 0) {
        throw transport_error("no response: GET " + url);
    }

    http_response res;
    res.status  = cc.status;
    res.body    = cc.body;
    res.headers = cc.headers;
    return res;
}

} // namespace mz::net
