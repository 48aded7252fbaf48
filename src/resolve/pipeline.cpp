#include "mz/resolve/pipeline.hpp"

#include "mz/core/errors.hpp"
#include "mz/util/text.hpp"

#include <algorithm>
#include <sstream>

namespace mz::resolve {

resolution_pipeline::resolution_pipeline(std::vector<providers::provider_adapter> adapters,
                                         std::shared_ptr<const providers::url_verifier> verifier,
                                         pipeline_options opts,
                                         logger log)
    : m_adapters(std::move(adapters))
    , m_verifier(std::move(verifier))
    , m_opts(std::move(opts))
    , m_log(std::move(log))
{
}

const providers::provider_adapter* resolution_pipeline::find_adapter(provider_id id) const
{
    for (const auto& a : m_adapters) {
        if (a.id == id && a.search) {
            return &a;
        }
    }
    return nullptr;
}

std::vector<provider_id> resolution_pipeline::try_order(std::optional<provider_id> preferred) const
{
    std::vector<provider_id> order;
    auto add = [&](provider_id id) {
        if (find_adapter(id) && std::find(order.begin(), order.end(), id) == order.end()) {
            order.push_back(id);
        }
    };

    if (preferred) {
        add(*preferred);
    }
    for (const auto id : m_opts.priority_order) {
        add(id);
    }
    return order;
}

std::optional<track_ptr> resolution_pipeline::commit(const providers::track_candidate& c, quality q) const
{
    std::string chosen;
    if (c.verified) {
        if (!c.media_refs.empty()) {
            chosen = c.media_refs.front();
        }
    } else {
        for (const auto& ref : c.media_refs) {
            if (m_verifier->verify(ref)) {
                chosen = ref;
                break;
            }
        }
    }
    if (chosen.empty()) {
        return std::nullopt;
    }

    track t;
    t.title             = c.title;
    t.artist            = c.artist;
    t.duration_seconds  = c.duration_seconds;
    t.source_provider   = c.provider;
    t.media_ref         = chosen;
    t.kind              = c.kind;
    t.requested_quality = q;
    t.page_url          = c.page_url;
    t.variants          = c.variants;
    return make_track(std::move(t));
}

track_ptr resolution_pipeline::resolve(const std::string& query,
                                       std::optional<provider_id> preferred,
                                       quality q) const
{
    if (util::trim(query).empty()) {
        throw resolution_failed(query, {});
    }

    std::vector<provider_id> tried;
    for (const auto id : try_order(preferred)) {
        tried.push_back(id);
        const auto* adapter = find_adapter(id);

        std::vector<providers::track_candidate> candidates;
        try {
            candidates = adapter->search(query, q);
        } catch (const provider_unavailable& e) {
            m_log.log(dpp::ll_warning, std::string("Resolve: ") + e.what());
            continue;
        } catch (const std::exception& e) {
            m_log.log(dpp::ll_warning, "Resolve: " + provider_name(id) + " failed on '" + query + "': " + e.what());
            continue;
        }

        const auto best = select_best(query, candidates, m_opts.scoring);
        if (!best) {
            m_log.log(dpp::ll_debug, "Resolve: " + provider_name(id) + " had no match for '" + query + "'");
            continue;
        }

        const auto& c = candidates[*best];
        if (auto t = commit(c, q)) {
            std::ostringstream oss;
            oss << "Resolve: '" << query << "' -> '" << (*t)->title << "' via " << provider_name(id);
            m_log.log(dpp::ll_info, oss.str());
            return *t;
        }

        m_log.log(dpp::ll_warning, "Resolve: " + provider_name(id) + " candidate '" + c.title + "' did not verify");
    }

    throw resolution_failed(query, tried);
}

} // namespace mz::resolve
