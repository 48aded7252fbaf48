#include "mz/providers/url_verifier.hpp"

#include "mz/util/text.hpp"

#include <sstream>

namespace mz::providers {

url_verifier::url_verifier(std::shared_ptr<net::http_client> http,
                           std::chrono::milliseconds timeout,
                           logger log)
    : m_http(std::move(http))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

bool url_verifier::is_playable_content_type(const std::string& content_type)
{
    // Some CDNs omit the header on ranged replies
    if (content_type.empty()) {
        return true;
    }

    const std::string ct = util::to_lower(content_type);
    return ct.rfind("audio/", 0) == 0
        || ct.rfind("video/", 0) == 0
        || ct.rfind("application/octet-stream", 0) == 0
        || ct.rfind("binary/octet-stream", 0) == 0
        || ct.rfind("application/vnd.apple.mpegurl", 0) == 0
        || ct.rfind("application/x-mpegurl", 0) == 0
        || ct.rfind("audio/mpegurl", 0) == 0;
}

bool url_verifier::verify(const std::string& media_ref) const
{
    if (media_ref.rfind("http://", 0) != 0 && media_ref.rfind("https://", 0) != 0) {
        m_log.log(dpp::ll_debug, "Verifier: not an http(s) URL: " + media_ref);
        return false;
    }

    net::http_response res;
    try {
        res = m_http->get(media_ref, { { "Range", "bytes=0-1" } }, m_timeout);
    } catch (const net::transport_error& e) {
        m_log.log(dpp::ll_warning, std::string("Verifier: request failed: ") + e.what());
        return false;
    } catch (const std::exception& e) {
        m_log.log(dpp::ll_warning, std::string("Verifier: unexpected error: ") + e.what());
        return false;
    }

    const bool status_ok = res.status == 200 || res.status == 206;
    const std::string content_type = res.header("Content-Type");
    const bool playable = status_ok && is_playable_content_type(content_type);

    std::ostringstream oss;
    oss << "Verifier: " << (playable ? "accepted" : "rejected") << " " << media_ref
        << " (status=" << res.status
        << ", content-type=" << (content_type.empty() ? "<none>" : content_type) << ")";
    m_log.log(playable ? dpp::ll_debug : dpp::ll_warning, oss.str());

    return playable;
}

} // namespace mz::providers
