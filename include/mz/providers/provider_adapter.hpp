#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mz/core/track.hpp"
#include "mz/log.hpp"
#include "mz/net/http_client.hpp"

namespace mz::providers {

/// Provisional match, only alive inside the resolution pipeline.
struct track_candidate {
    std::string  title;
    std::string  artist;
    std::int64_t duration_seconds = 0;
    provider_id  provider         = provider_id::a;

    // Alternatives in priority order; the pipeline commits to the first that verifies
    std::vector<std::string>   media_refs;
    media_kind                 kind = media_kind::direct;
    std::vector<media_variant> variants;
    std::string                page_url;

    bool verified = false;

    /// Best tier among the variants; medium when the provider declares none.
    quality declared_quality() const;
};

/// Returns zero or more candidates. An empty result is "no match"; transport
/// failure throws provider_unavailable.
using search_fn = std::function<std::vector<track_candidate>(const std::string& query, quality q)>;

/// One provider's entry in the dispatch table.
struct provider_adapter {
    provider_id id = provider_id::a;
    search_fn   search;
};

/// Binds any strategy exposing `search(query, quality)` into a table entry.
template <typename Strategy>
provider_adapter make_adapter(provider_id id, std::shared_ptr<const Strategy> strategy)
{
    provider_adapter a;
    a.id     = id;
    a.search = [strategy](const std::string& query, quality q) {
        return strategy->search(query, q);
    };
    return a;
}

struct adapter_options {
    std::shared_ptr<net::http_client> http;
    std::chrono::milliseconds         timeout{ 10000 };
    std::string                       soundcloud_client_id;
    logger                            log;
};

/// youtube (A), spotify (B, falling back onto A) and soundcloud (C).
std::vector<provider_adapter> make_default_adapters(const adapter_options& opts);

/// Orders variant URLs for a requested tier: that tier, lower tiers
/// descending, then higher tiers ascending.
std::vector<std::string> refs_for_quality(const std::vector<media_variant>& variants, quality q);

} // namespace mz::providers
