#include "mz/stream/stream_preparer.hpp"

#include "mz/core/errors.hpp"
#include "mz/stream/hls.hpp"

#include <algorithm>
#include <sstream>

namespace mz::stream {

http_stream_preparer::http_stream_preparer(std::shared_ptr<net::http_client> http,
                                           std::shared_ptr<const providers::url_verifier> verifier,
                                           std::chrono::milliseconds timeout,
                                           logger log)
    : m_http(std::move(http))
    , m_verifier(std::move(verifier))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

std::vector<http_stream_preparer::choice> http_stream_preparer::variant_order(const track& t)
{
    std::vector<choice> out;
    auto seen = [&](const std::string& url) {
        return std::any_of(out.begin(), out.end(), [&](const choice& c) { return c.url == url; });
    };

    for (const auto tier : tier_fallback_order(t.requested_quality)) {
        for (const auto& v : t.variants) {
            if (v.tier == tier && !seen(v.url)) {
                out.push_back({ v.tier, v.url });
            }
        }
    }
    if (!seen(t.media_ref)) {
        out.push_back({ t.requested_quality, t.media_ref });
    }
    return out;
}

std::vector<std::string> http_stream_preparer::expand_hls(const std::string& url, int depth)
{
    net::http_response res;
    try {
        res = m_http->get(url, {}, m_timeout);
    } catch (const net::transport_error& e) {
        m_log.log(dpp::ll_warning, std::string("Preparer: playlist fetch failed: ") + e.what());
        return {};
    }
    if (!res.ok()) {
        m_log.log(dpp::ll_warning, "Preparer: playlist returned status " + std::to_string(res.status));
        return {};
    }

    auto playlist = parse_hls(res.body, url);
    if (playlist.is_master()) {
        if (depth > 0) {
            return {};
        }
        std::stable_sort(playlist.variants.begin(), playlist.variants.end(),
            [](const hls_variant& l, const hls_variant& r) { return l.bandwidth > r.bandwidth; });
        for (const auto& v : playlist.variants) {
            auto segments = expand_hls(v.url, depth + 1);
            if (!segments.empty()) {
                return segments;
            }
        }
        return {};
    }
    return playlist.segments;
}

stream_handle_ptr http_stream_preparer::open(const track_ptr& t, const choice& c)
{
    if (!m_verifier->verify(c.url)) {
        return nullptr;
    }

    std::vector<std::string> segments;
    if (is_hls_url(c.url)) {
        segments = expand_hls(c.url, 0);
        if (segments.empty()) {
            return nullptr;
        }
    } else {
        segments.push_back(c.url);
    }

    std::ostringstream oss;
    oss << "Preparer: '" << t->title << "' at " << to_string(c.tier)
        << " (" << segments.size() << " segment(s))";
    m_log.log(dpp::ll_debug, oss.str());

    return std::make_shared<stream_handle>(t, c.tier, c.url, std::move(segments), m_http, m_timeout);
}

stream_handle_ptr http_stream_preparer::prepare(const track_ptr& t)
{
    if (!t) {
        throw stream_unavailable("no track to prepare");
    }

    if (t->kind == media_kind::page) {
        return std::make_shared<stream_handle>(t, t->requested_quality, t->media_ref,
                                               std::vector<std::string>{}, m_http, m_timeout);
    }

    for (const auto& c : variant_order(*t)) {
        if (auto h = open(t, c)) {
            return h;
        }
        m_log.log(dpp::ll_warning, "Preparer: variant " + to_string(c.tier) + " of '" + t->title + "' unusable");
    }

    throw stream_unavailable("no playable variant for '" + t->title + "'");
}

} // namespace mz::stream
