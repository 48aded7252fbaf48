#include "mz/providers/soundcloud.hpp"

#include "mz/core/errors.hpp"
#include "mz/util/json.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>

#include <dpp/utility.h>

namespace mz::providers {

namespace {

struct transcoding {
    quality     tier = quality::medium;
    bool        progressive = false;
    std::string url;
};

} // namespace

soundcloud_search::soundcloud_search(std::shared_ptr<net::http_client> http,
                                     std::string client_id,
                                     std::chrono::milliseconds timeout,
                                     logger log)
    : m_http(std::move(http))
    , m_client_id(std::move(client_id))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

std::string soundcloud_search::with_client_id(const std::string& url) const
{
    const char sep = url.find('?') == std::string::npos ? '?' : '&';
    return url + sep + "client_id=" + dpp::utility::url_encode(m_client_id);
}

std::string soundcloud_search::resolve_transcoding(const std::string& url) const
{
    net::http_response res;
    try {
        res = m_http->get(with_client_id(url), {}, m_timeout);
    } catch (const net::transport_error& e) {
        m_log.log(dpp::ll_warning, std::string("SoundCloud: transcoding lookup failed: ") + e.what());
        return "";
    }
    if (!res.ok()) {
        m_log.log(dpp::ll_warning, "SoundCloud: transcoding lookup returned " + std::to_string(res.status));
        return "";
    }

    const auto j = dpp::json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return "";
    }
    return util::string_field(j, "url");
}

std::optional<track_candidate> soundcloud_search::to_candidate(const dpp::json& item, quality q) const
{
    track_candidate c;
    c.provider         = provider_id::c;
    c.title            = util::string_field(item, "title");
    c.duration_seconds = util::int_field(item, "duration") / 1000;
    c.page_url         = util::string_field(item, "permalink_url");
    if (const auto* user = util::object_field(item, "user")) {
        c.artist = util::string_field(*user, "username");
    }
    if (c.title.empty()) {
        return std::nullopt;
    }

    std::vector<transcoding> found;
    const auto* media = util::object_field(item, "media");
    const auto* transcodings = media != nullptr ? util::array_field(*media, "transcodings") : nullptr;
    if (transcodings != nullptr) {
        for (const auto& t : *transcodings) {
            transcoding tc;
            tc.url  = util::string_field(t, "url");
            tc.tier = util::string_field(t, "quality", "sq") == "hq" ? quality::high : quality::medium;
            if (const auto* format = util::object_field(t, "format")) {
                tc.progressive = util::string_field(*format, "protocol") == "progressive";
            }
            if (!tc.url.empty()) {
                found.push_back(std::move(tc));
            }
        }
    }

    std::stable_sort(found.begin(), found.end(), [](const transcoding& l, const transcoding& r) {
        if (l.tier != r.tier) {
            return quality_rank(l.tier) > quality_rank(r.tier);
        }
        return l.progressive && !r.progressive;
    });

    for (const auto& tc : found) {
        const std::string stream = resolve_transcoding(tc.url);
        if (!stream.empty()) {
            c.variants.push_back({ tc.tier, stream });
        }
    }

    c.media_refs = refs_for_quality(c.variants, q);
    if (c.media_refs.empty()) {
        return std::nullopt;
    }
    return c;
}

std::vector<track_candidate> soundcloud_search::search(const std::string& query, quality q) const
{
    if (m_client_id.empty()) {
        m_log.log(dpp::ll_debug, "SoundCloud: no client id configured, skipping");
        return {};
    }

    const std::string url = "https://api-v2.soundcloud.com/search/tracks?q=" + dpp::utility::url_encode(query)
                          + "&limit=5";

    net::http_response res;
    try {
        res = m_http->get(with_client_id(url), { { "Accept", "application/json" } }, m_timeout);
    } catch (const net::transport_error& e) {
        throw provider_unavailable(provider_id::c, e.what());
    }
    if (!res.ok()) {
        throw provider_unavailable(provider_id::c, "search returned status " + std::to_string(res.status));
    }

    const auto j = dpp::json::parse(res.body, nullptr, false);
    const auto* collection = j.is_discarded() ? nullptr : util::array_field(j, "collection");
    if (collection == nullptr) {
        m_log.log(dpp::ll_warning, "SoundCloud: unexpected search response");
        return {};
    }

    std::vector<track_candidate> out;
    for (const auto& item : *collection) {
        if (out.size() >= max_tracks) {
            break;
        }
        if (auto c = to_candidate(item, q)) {
            out.push_back(std::move(*c));
        }
    }

    std::ostringstream oss;
    oss << "SoundCloud: '" << query << "' -> " << out.size() << " candidate(s)";
    m_log.log(dpp::ll_debug, oss.str());
    return out;
}

} // namespace mz::providers
