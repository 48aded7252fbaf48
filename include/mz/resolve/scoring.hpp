#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mz/providers/provider_adapter.hpp"

namespace mz::resolve {

struct scoring_options {
    // Title similarities this close count as equal and fall through to
    // quality. 0 means only exact ties do.
    double title_tolerance = 0.0;
};

/// Token-set Jaccard overlap in [0, 1]. Artist tokens count toward the
/// candidate side.
double title_similarity(const std::string& query, const providers::track_candidate& c);

/// Index of the best candidate, none for an empty list. Candidates are
/// ranked by title similarity, then declared quality, then the shorter
/// known duration (unknown loses), then their order in the list. A later
/// key is only consulted when every earlier one ties.
std::optional<std::size_t> select_best(const std::string& query,
                                       const std::vector<providers::track_candidate>& candidates,
                                       const scoring_options& opts);

} // namespace mz::resolve
