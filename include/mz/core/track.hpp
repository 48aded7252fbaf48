#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <dpp/json.h>

namespace mz {

// A = youtube, B = spotify, C = soundcloud
enum class provider_id {
    a,
    b,
    c
};

// Declared in rank order, lowest first
enum class quality {
    low,
    medium,
    high
};

enum class media_kind {
    direct, // playable URL
    page    // provider page, resolved by the audio sink
};

struct media_variant {
    quality     tier = quality::medium;
    std::string url;
};

struct track {
    std::string  title;
    std::string  artist;
    std::int64_t duration_seconds = 0; // 0 = unknown / live
    provider_id  source_provider  = provider_id::a;
    std::string  media_ref;
    media_kind   kind              = media_kind::direct;
    quality      requested_quality = quality::high;
    std::string  page_url;

    // Alternative encodings of the same track, best first
    std::vector<media_variant> variants;
};

using track_ptr = std::shared_ptr<const track>;

/// Freezes a track. Throws std::invalid_argument if media_ref is empty.
track_ptr make_track(track t);

std::string provider_name(provider_id id);
std::optional<provider_id> parse_provider(const std::string& text);

std::string to_string(quality q);
std::optional<quality> parse_quality(const std::string& text);
int quality_rank(quality q);

/// Tiers to try for a request of `q`: q itself, then lower tiers descending,
/// then higher tiers ascending.
std::vector<quality> tier_fallback_order(quality q);

/// "3:07", "1:02:03", or "live" for 0
std::string format_duration(std::int64_t seconds);

dpp::json track_to_json(const track& t);
track_ptr track_from_json(const dpp::json& j);

} // namespace mz
