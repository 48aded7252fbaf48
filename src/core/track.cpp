#include "mz/core/track.hpp"

#include "mz/util/text.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mz {

track_ptr make_track(track t)
{
    if (t.media_ref.empty()) {
        throw std::invalid_argument("track '" + t.title + "' has no media reference");
    }
    return std::make_shared<const track>(std::move(t));
}

std::string provider_name(provider_id id)
{
    switch (id) {
        case provider_id::a: return "youtube";
        case provider_id::b: return "spotify";
        case provider_id::c: return "soundcloud";
    }
    return "unknown";
}

std::optional<provider_id> parse_provider(const std::string& text)
{
    const std::string s = util::to_lower(util::trim(text));
    if (s == "a" || s == "yt" || s == "youtube") {
        return provider_id::a;
    }
    if (s == "b" || s == "spotify") {
        return provider_id::b;
    }
    if (s == "c" || s == "sc" || s == "soundcloud") {
        return provider_id::c;
    }
    return std::nullopt;
}

std::string to_string(quality q)
{
    switch (q) {
        case quality::low:    return "low";
        case quality::medium: return "medium";
        case quality::high:   return "high";
    }
    return "unknown";
}

std::optional<quality> parse_quality(const std::string& text)
{
    const std::string s = util::to_lower(util::trim(text));
    if (s == "high") {
        return quality::high;
    }
    if (s == "medium") {
        return quality::medium;
    }
    if (s == "low") {
        return quality::low;
    }
    return std::nullopt;
}

int quality_rank(quality q)
{
    return static_cast<int>(q);
}

std::vector<quality> tier_fallback_order(quality q)
{
    std::vector<quality> order{ q };
    for (int r = quality_rank(q) - 1; r >= quality_rank(quality::low); --r) {
        order.push_back(static_cast<quality>(r));
    }
    for (int r = quality_rank(q) + 1; r <= quality_rank(quality::high); ++r) {
        order.push_back(static_cast<quality>(r));
    }
    return order;
}

std::string format_duration(std::int64_t seconds)
{
    if (seconds <= 0) {
        return "live";
    }

    const auto h = seconds / 3600;
    const auto m = (seconds % 3600) / 60;
    const auto s = seconds % 60;

    std::ostringstream oss;
    if (h > 0) {
        oss << h << ':' << std::setw(2) << std::setfill('0') << m;
    } else {
        oss << m;
    }
    oss << ':' << std::setw(2) << std::setfill('0') << s;
    return oss.str();
}

dpp::json track_to_json(const track& t)
{
    dpp::json j;
    j["title"]     = t.title;
    j["artist"]    = t.artist;
    j["duration"]  = t.duration_seconds;
    j["provider"]  = provider_name(t.source_provider);
    j["mediaRef"]  = t.media_ref;
    j["page"]      = t.kind == media_kind::page;
    j["quality"]   = to_string(t.requested_quality);
    j["pageUrl"]   = t.page_url;

    j["variants"] = dpp::json::array();
    for (const auto& v : t.variants) {
        dpp::json jv;
        jv["quality"] = to_string(v.tier);
        jv["url"]     = v.url;
        j["variants"].push_back(jv);
    }
    return j;
}

track_ptr track_from_json(const dpp::json& j)
{
    track t;
    t.title            = j.value("title", "");
    t.artist           = j.value("artist", "");
    t.duration_seconds = j.value("duration", static_cast<std::int64_t>(0));
    t.source_provider  = parse_provider(j.value("provider", "")).value_or(provider_id::a);
    t.media_ref        = j.value("mediaRef", "");
    t.kind             = j.value("page", false) ? media_kind::page : media_kind::direct;
    t.requested_quality = parse_quality(j.value("quality", "")).value_or(quality::high);
    t.page_url         = j.value("pageUrl", "");

    if (j.contains("variants") && j["variants"].is_array()) {
        for (const auto& jv : j["variants"]) {
            media_variant v;
            v.tier = parse_quality(jv.value("quality", "")).value_or(quality::medium);
            v.url  = jv.value("url", "");
            if (!v.url.empty()) {
                t.variants.push_back(std::move(v));
            }
        }
    }

    return make_track(std::move(t));
}

} // namespace mz
