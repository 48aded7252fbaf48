#include "mz/providers/youtube.hpp"

#include "mz/core/errors.hpp"
#include "mz/util/json.hpp"
#include "mz/util/text.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <boost/regex.hpp>
#include <dpp/json.h>
#include <dpp/utility.h>

namespace mz::providers {

namespace {

// Cuts the object literal following `marker` out of a script tag.
std::string extract_json_object(const std::string& html, const std::string& marker)
{
    auto pos = html.find(marker);
    if (pos == std::string::npos) {
        return "";
    }
    pos = html.find('{', pos + marker.size());
    if (pos == std::string::npos) {
        return "";
    }

    const auto start = pos;
    int depth = 0;
    bool in_string = false;
    for (; pos < html.size(); ++pos) {
        const char c = html[pos];
        if (in_string) {
            if (c == '\\') {
                ++pos;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return html.substr(start, pos - start + 1);
            }
        }
    }
    return "";
}

std::int64_t to_int(const std::string& s)
{
    return std::strtoll(s.c_str(), nullptr, 10);
}

quality tier_of(const std::string& audio_quality)
{
    if (audio_quality.find("HIGH") != std::string::npos) {
        return quality::high;
    }
    if (audio_quality.find("MEDIUM") != std::string::npos) {
        return quality::medium;
    }
    return quality::low;
}

std::string first_match(const std::string& html, const boost::regex& re)
{
    boost::smatch m;
    if (boost::regex_search(html, m, re)) {
        return m[1];
    }
    return "";
}

void read_player_response(const dpp::json& player, track_candidate& c)
{
    if (const auto* details = util::object_field(player, "videoDetails")) {
        c.title  = util::string_field(*details, "title");
        c.artist = util::string_field(*details, "author");
        if (!util::bool_field(*details, "isLive")) {
            c.duration_seconds = to_int(util::string_field(*details, "lengthSeconds", "0"));
        }
    }

    const auto* streaming = util::object_field(player, "streamingData");
    if (streaming == nullptr) {
        return;
    }

    if (const auto* formats = util::array_field(*streaming, "adaptiveFormats")) {
        for (const auto& fmt : *formats) {
            const std::string mime = util::string_field(fmt, "mimeType");
            const std::string url  = util::string_field(fmt, "url");
            // Ciphered formats carry no url and are skipped
            if (mime.rfind("audio/", 0) != 0 || url.empty()) {
                continue;
            }
            c.variants.push_back({ tier_of(util::string_field(fmt, "audioQuality")), url });
        }
    }

    const std::string hls = util::string_field(*streaming, "hlsManifestUrl");
    if (c.variants.empty() && !hls.empty()) {
        c.variants.push_back({ quality::medium, hls });
    }

    std::stable_sort(c.variants.begin(), c.variants.end(),
        [](const media_variant& l, const media_variant& r) {
            return quality_rank(l.tier) > quality_rank(r.tier);
        });
}

} // namespace

youtube_search::youtube_search(std::shared_ptr<net::http_client> http,
                               std::chrono::milliseconds timeout,
                               logger log)
    : m_http(std::move(http))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

std::string youtube_search::watch_url(const std::string& video_id)
{
    return "https://www.youtube.com/watch?v=" + video_id;
}

std::vector<std::string> youtube_search::extract_video_ids(const std::string& html, std::size_t limit)
{
    static const boost::regex re(R"re("videoId":"([A-Za-z0-9_-]{11})")re");

    std::vector<std::string> ids;
    auto begin = boost::sregex_iterator(html.begin(), html.end(), re);
    for (auto it = begin; it != boost::sregex_iterator() && ids.size() < limit; ++it) {
        const std::string id = (*it)[1];
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::string youtube_search::video_id_from_url(const std::string& url)
{
    static const boost::regex re(
        R"(^(?:https?://)?(?:www\.|m\.|music\.)?(?:youtube\.com/(?:watch\?v=|shorts/|embed/)|youtu\.be/)([\w-]{11}))");
    return first_match(url, re);
}

std::optional<track_candidate> youtube_search::parse_watch_page(const std::string& video_id,
                                                                const std::string& html,
                                                                quality q)
{
    track_candidate c;
    c.provider = provider_id::a;
    c.page_url = watch_url(video_id);

    const std::string raw = extract_json_object(html, "ytInitialPlayerResponse");
    const auto player = dpp::json::parse(raw.empty() ? std::string("null") : raw, nullptr, false);
    if (!player.is_discarded() && player.is_object()) {
        read_player_response(player, c);
    }

    if (c.title.empty()) {
        static const boost::regex title_re(R"(<title>([^<]+)</title>)");
        static const boost::regex length_re(R"re("lengthSeconds":"(\d+)")re");
        static const boost::regex author_re(R"re("author":"([^"]+)")re");

        std::string title = util::decode_html_entities(util::trim(first_match(html, title_re)));
        const auto suffix = title.rfind(" - YouTube");
        if (suffix != std::string::npos) {
            title.erase(suffix);
        }
        if (title.empty() || title == "YouTube") {
            return std::nullopt;
        }
        c.title = title;
        c.artist = util::unescape_json_string(first_match(html, author_re));
        c.duration_seconds = to_int(first_match(html, length_re));
    }

    c.media_refs = refs_for_quality(c.variants, q);
    if (c.media_refs.empty()) {
        // The page itself answered, so the reference is live
        c.kind       = media_kind::page;
        c.media_refs = { c.page_url };
        c.verified   = true;
    }
    return c;
}

std::optional<track_candidate> youtube_search::inspect(const std::string& video_id, quality q,
                                                      std::chrono::milliseconds timeout) const
{
    net::http_response res;
    try {
        res = m_http->get(watch_url(video_id), {}, timeout);
    } catch (const net::transport_error& e) {
        m_log.log(dpp::ll_warning, "YouTube: watch page " + video_id + " failed: " + e.what());
        return std::nullopt;
    }

    if (!res.ok()) {
        std::ostringstream oss;
        oss << "YouTube: watch page " << video_id << " returned " << res.status;
        m_log.log(dpp::ll_warning, oss.str());
        return std::nullopt;
    }

    auto c = parse_watch_page(video_id, res.body, q);
    if (c) {
        std::ostringstream oss;
        oss << "YouTube: " << video_id << " '" << c->title << "' "
            << c->variants.size() << " audio format(s)";
        m_log.log(dpp::ll_debug, oss.str());
    }
    return c;
}

std::vector<track_candidate> youtube_search::search(const std::string& query, quality q) const
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + m_timeout;
    auto remaining = [&deadline] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    };

    std::vector<std::string> ids;

    const std::string direct = video_id_from_url(util::trim(query));
    if (!direct.empty()) {
        ids.push_back(direct);
    } else {
        const std::string url = "https://www.youtube.com/results?search_query=" + dpp::utility::url_encode(query);

        net::http_response res;
        try {
            res = m_http->get(url, {}, m_timeout);
        } catch (const net::transport_error& e) {
            throw provider_unavailable(provider_id::a, e.what());
        }
        if (!res.ok()) {
            throw provider_unavailable(provider_id::a, "search returned status " + std::to_string(res.status));
        }

        ids = extract_video_ids(res.body, max_ids);
    }

    std::vector<track_candidate> out;
    for (const auto& id : ids) {
        if (out.size() >= max_pages) {
            break;
        }
        const auto left = remaining();
        if (left.count() <= 0) {
            std::ostringstream oss;
            oss << "YouTube: out of time for '" << query << "' after " << out.size() << " candidate(s)";
            m_log.log(dpp::ll_warning, oss.str());
            break;
        }
        if (auto c = inspect(id, q, left)) {
            out.push_back(std::move(*c));
        }
    }

    std::ostringstream oss;
    oss << "YouTube: '" << query << "' -> " << out.size() << " candidate(s)";
    m_log.log(dpp::ll_debug, oss.str());
    return out;
}

} // namespace mz::providers
