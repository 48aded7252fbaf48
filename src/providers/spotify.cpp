#include "mz/providers/spotify.hpp"

#include "mz/core/errors.hpp"
#include "mz/resolve/scoring.hpp"
#include "mz/util/text.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <boost/regex.hpp>
#include <dpp/utility.h>

namespace mz::providers {

namespace {

std::string first_match(const std::string& html, const boost::regex& re)
{
    boost::smatch m;
    if (boost::regex_search(html, m, re)) {
        return util::unescape_json_string(m[1]);
    }
    return "";
}

} // namespace

spotify_search::spotify_search(std::shared_ptr<net::http_client> http,
                               std::shared_ptr<const youtube_search> audio_source,
                               std::chrono::milliseconds timeout,
                               logger log)
    : m_http(std::move(http))
    , m_audio(std::move(audio_source))
    , m_timeout(timeout)
    , m_log(std::move(log))
{
}

std::optional<spotify_metadata> spotify_search::scrape_metadata(const std::string& html)
{
    static const boost::regex name_re(R"re("name":"((?:[^"\\]|\\.)+)")re");
    static const boost::regex artist_re(R"re("artist":"((?:[^"\\]|\\.)+)")re");
    static const boost::regex album_re(R"re("album":"((?:[^"\\]|\\.)+)")re");
    static const boost::regex duration_re(R"re("duration_ms":(\d+))re");

    spotify_metadata md;
    md.title  = first_match(html, name_re);
    md.artist = first_match(html, artist_re);
    md.album  = first_match(html, album_re);

    boost::smatch m;
    if (boost::regex_search(html, m, duration_re)) {
        md.duration_seconds = std::strtoll(m[1].str().c_str(), nullptr, 10) / 1000;
    }

    if (md.title.empty()) {
        return std::nullopt;
    }
    return md;
}

std::optional<spotify_metadata> spotify_search::lookup(const std::string& query) const
{
    const std::string url = "https://open.spotify.com/search/" + dpp::utility::url_encode(query);

    net::http_response res;
    try {
        res = m_http->get(url, {}, m_timeout);
    } catch (const net::transport_error& e) {
        m_log.log(dpp::ll_warning, std::string("Spotify: search page failed: ") + e.what());
        return std::nullopt;
    }
    if (!res.ok()) {
        m_log.log(dpp::ll_warning, "Spotify: search page returned " + std::to_string(res.status));
        return std::nullopt;
    }
    return scrape_metadata(res.body);
}

std::vector<track_candidate> spotify_search::search_audio(const std::string& query, quality q) const
{
    try {
        return m_audio->search(query, q);
    } catch (const provider_unavailable& e) {
        throw provider_unavailable(provider_id::b, e.what());
    }
}

std::vector<track_candidate> spotify_search::search(const std::string& query, quality q) const
{
    std::vector<track_candidate> out;

    if (const auto md = lookup(query)) {
        std::ostringstream oss;
        oss << "Spotify: '" << query << "' -> '" << md->title << "' by '" << md->artist << "'";
        m_log.log(dpp::ll_debug, oss.str());

        const std::string wanted = util::trim(md->title + " " + md->artist);
        out = search_audio(wanted, q);
        for (auto& c : out) {
            c.provider = provider_id::b;
        }

        // Only the upload closest to the Spotify track takes its labels. The
        // rest keep their own titles so the pipeline can still tell them apart.
        if (!out.empty()) {
            std::vector<double> sims;
            for (const auto& c : out) {
                sims.push_back(resolve::title_similarity(wanted, c));
            }
            const auto best = std::max_element(sims.begin(), sims.end()) - sims.begin();
            std::rotate(out.begin(), out.begin() + best, out.begin() + best + 1);

            auto& c = out.front();
            c.title = md->title;
            if (!md->artist.empty()) {
                c.artist = md->artist;
            }
            if (md->duration_seconds > 0) {
                c.duration_seconds = md->duration_seconds;
            }
        }
    }

    if (out.empty()) {
        out = search_audio(query + " music", q);
        for (auto& c : out) {
            c.provider = provider_id::b;
        }
    }
    return out;
}

} // namespace mz::providers
