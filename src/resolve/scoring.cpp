#include "mz/resolve/scoring.hpp"

#include "mz/util/text.hpp"

#include <cmath>
#include <set>

namespace mz::resolve {

double title_similarity(const std::string& query, const providers::track_candidate& c)
{
    const auto q_tokens = util::tokenize(query);
    auto c_tokens = util::tokenize(c.title);
    const auto a_tokens = util::tokenize(c.artist);
    c_tokens.insert(c_tokens.end(), a_tokens.begin(), a_tokens.end());

    const std::set<std::string> qs(q_tokens.begin(), q_tokens.end());
    const std::set<std::string> cs(c_tokens.begin(), c_tokens.end());
    if (qs.empty() || cs.empty()) {
        return 0.0;
    }

    std::size_t shared = 0;
    for (const auto& t : qs) {
        shared += cs.count(t);
    }
    const std::size_t total = qs.size() + cs.size() - shared;
    return static_cast<double>(shared) / static_cast<double>(total);
}

namespace {

struct ranked {
    double       similarity;
    int          quality;
    std::int64_t duration; // 0 when unknown
};

bool shorter(std::int64_t l, std::int64_t r)
{
    if (l > 0 && r > 0) {
        return l < r;
    }
    return l > 0 && r <= 0;
}

// Strictly ahead; equal keys keep the earlier candidate.
bool ahead(const ranked& l, const ranked& r, double tolerance)
{
    if (std::fabs(l.similarity - r.similarity) > tolerance) {
        return l.similarity > r.similarity;
    }
    if (l.quality != r.quality) {
        return l.quality > r.quality;
    }
    return shorter(l.duration, r.duration);
}

} // namespace

std::optional<std::size_t> select_best(const std::string& query,
                                       const std::vector<providers::track_candidate>& candidates,
                                       const scoring_options& opts)
{
    if (candidates.empty()) {
        return std::nullopt;
    }

    auto rank = [&](const providers::track_candidate& c) {
        return ranked{ title_similarity(query, c), quality_rank(c.declared_quality()), c.duration_seconds };
    };

    std::size_t best = 0;
    ranked best_rank = rank(candidates[0]);
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const ranked r = rank(candidates[i]);
        if (ahead(r, best_rank, opts.title_tolerance)) {
            best = i;
            best_rank = r;
        }
    }
    return best;
}

} // namespace mz::resolve
