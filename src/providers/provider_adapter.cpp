#include "mz/providers/provider_adapter.hpp"

#include "mz/providers/soundcloud.hpp"
#include "mz/providers/spotify.hpp"
#include "mz/providers/youtube.hpp"

#include <algorithm>

namespace mz::providers {

quality track_candidate::declared_quality() const
{
    if (variants.empty()) {
        return quality::medium;
    }
    const auto best = std::max_element(variants.begin(), variants.end(),
        [](const media_variant& l, const media_variant& r) {
            return quality_rank(l.tier) < quality_rank(r.tier);
        });
    return best->tier;
}

std::vector<std::string> refs_for_quality(const std::vector<media_variant>& variants, quality q)
{
    std::vector<std::string> out;
    for (const auto tier : tier_fallback_order(q)) {
        for (const auto& v : variants) {
            if (v.tier == tier && std::find(out.begin(), out.end(), v.url) == out.end()) {
                out.push_back(v.url);
            }
        }
    }
    return out;
}

std::vector<provider_adapter> make_default_adapters(const adapter_options& opts)
{
    auto yt = std::make_shared<const youtube_search>(opts.http, opts.timeout, opts.log);
    auto sp = std::make_shared<const spotify_search>(opts.http, yt, opts.timeout, opts.log);
    auto sc = std::make_shared<const soundcloud_search>(opts.http, opts.soundcloud_client_id,
                                                        opts.timeout, opts.log);

    std::vector<provider_adapter> adapters;
    adapters.push_back(make_adapter(provider_id::a, yt));
    adapters.push_back(make_adapter(provider_id::b, sp));
    adapters.push_back(make_adapter(provider_id::c, sc));
    return adapters;
}

} // namespace mz::providers
