#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mz::stream {

struct hls_variant {
    std::uint64_t bandwidth = 0;
    std::string   url;
};

/// A parsed .m3u8. A master playlist has variants, a media playlist has
/// segments. All URLs come out absolute.
struct hls_playlist {
    std::vector<std::string> segments;
    std::vector<hls_variant> variants;

    bool is_master() const { return !variants.empty(); }
};

hls_playlist parse_hls(const std::string& text, const std::string& base_url);

bool is_hls_url(const std::string& url);

} // namespace mz::stream
