#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mz/core/track.hpp"
#include "mz/log.hpp"
#include "mz/providers/provider_adapter.hpp"
#include "mz/providers/url_verifier.hpp"
#include "mz/resolve/scoring.hpp"

namespace mz::resolve {

struct pipeline_options {
    std::vector<provider_id> priority_order{ provider_id::a, provider_id::b, provider_id::c };
    scoring_options          scoring;
};

/// Turns a free-text query into one verified track, walking the providers
/// in fallback order. Safe to call from several threads at once.
class resolution_pipeline {
public:
    resolution_pipeline(std::vector<providers::provider_adapter> adapters,
                        std::shared_ptr<const providers::url_verifier> verifier,
                        pipeline_options opts,
                        logger log = {});

    /// Throws resolution_failed naming every provider asked, in order.
    track_ptr resolve(const std::string& query,
                      std::optional<provider_id> preferred,
                      quality q) const;

    /// Preferred provider first, then the priority order without repeats.
    /// Providers with no adapter are left out.
    std::vector<provider_id> try_order(std::optional<provider_id> preferred) const;

private:
    const providers::provider_adapter* find_adapter(provider_id id) const;
    std::optional<track_ptr> commit(const providers::track_candidate& c, quality q) const;

    std::vector<providers::provider_adapter>       m_adapters;
    std::shared_ptr<const providers::url_verifier> m_verifier;
    pipeline_options                               m_opts;
    logger                                         m_log;
};

} // namespace mz::resolve
